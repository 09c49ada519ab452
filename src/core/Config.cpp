#include "liftfix/core/Config.h"
#include "liftfix/core/YAMLMapping.h"

#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/YAMLTraits.h>
#include <llvm/Support/raw_ostream.h>

namespace llvm {
namespace yaml {

template <>
struct MappingTraits<liftfix::Config> {
    static void mapping(IO &io, liftfix::Config &cfg) {
        io.mapOptional("autofix",          cfg.autofix);
        io.mapOptional("dry_run",          cfg.dryRun);
        io.mapOptional("jobs",             cfg.jobs);
        io.mapOptional("max_target_bytes", cfg.maxTargetBytes);
        io.mapOptional("offset_unit",      cfg.offsetUnit);
        io.mapOptional("min_severity",     cfg.minSeverity);
        io.mapOptional("output_format",    cfg.outputFormat);
        io.mapOptional("output_file",      cfg.outputFile);
        io.mapOptional("quiet",            cfg.quiet);
        io.mapOptional("verbose",          cfg.verbose);
        io.mapOptional("disabled_rules",   cfg.disabledRules);
    }
};

} // namespace yaml
} // namespace llvm

namespace liftfix {

Config Config::defaults() {
    return Config{};
}

Config Config::loadFromFile(const std::string &path) {
    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        llvm::errs() << "liftfix: warning: cannot open config '"
                     << path << "', using defaults\n";
        return defaults();
    }

    Config cfg = defaults();
    llvm::yaml::Input yin(bufOrErr.get()->getBuffer());
    yin >> cfg;

    if (yin.error()) {
        llvm::errs() << "liftfix: warning: config parse error in '"
                     << path << "', using defaults\n";
        return defaults();
    }

    if (cfg.outputFormat != "text" && cfg.outputFormat != "json" &&
        cfg.outputFormat != "sarif") {
        llvm::errs() << "liftfix: warning: unknown output_format '"
                     << cfg.outputFormat << "' in '" << path
                     << "', using text\n";
        cfg.outputFormat = "text";
    }

    return cfg;
}

} // namespace liftfix
