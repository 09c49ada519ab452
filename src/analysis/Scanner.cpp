#include "liftfix/analysis/Scanner.h"
#include "liftfix/fixing/Splice.h"

#include <llvm/ADT/SmallString.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/MemoryBuffer.h>
#include <llvm/Support/Path.h>
#include <llvm/Support/raw_ostream.h>

#include <algorithm>
#include <future>
#include <semaphore>
#include <thread>

namespace liftfix {

namespace {

// x.fixed.c holds the expected output for x.c and is never a target itself.
bool isExpectationFile(llvm::StringRef path) {
    return llvm::sys::path::stem(path).endswith(".fixed") ||
           llvm::sys::path::extension(path) == ".fixed";
}

bool isHidden(llvm::StringRef path) {
    llvm::StringRef name = llvm::sys::path::filename(path);
    return name.size() > 1 && name.front() == '.' && name != "..";
}

std::string lineAt(llvm::StringRef text, size_t index) {
    llvm::SmallVector<llvm::StringRef, 32> lines;
    text.split(lines, '\n');
    return index < lines.size() ? lines[index].str() : std::string();
}

// 1-based number of the first line that differs, 0 when equal.
size_t firstDifferentLine(llvm::StringRef a, llvm::StringRef b) {
    if (a == b)
        return 0;
    size_t n = std::min(a.size(), b.size());
    size_t i = 0;
    while (i < n && a[i] == b[i])
        ++i;
    return static_cast<size_t>(a.take_front(i).count('\n')) + 1;
}

} // anonymous namespace

FileResult Scanner::scanBuffer(std::shared_ptr<const SourceBuffer> target,
                               const Language &lang) const {
    FileResult result;
    result.path = target->name();

    auto treeOrErr = lang.parseTarget(*target);
    if (!treeOrErr) {
        result.skipReason = llvm::toString(treeOrErr.takeError());
        return result;
    }

    std::string trace;
    llvm::raw_string_ostream traceOS(trace);
    for (const auto &rule : rules_.rules()) {
        if (!rule->appliesTo(lang))
            continue;
        rule->analyze(*target, *treeOrErr, lang, result.findings,
                      cfg_.verbose ? &traceOS : nullptr);
    }

    result.findings.erase(
        std::remove_if(result.findings.begin(), result.findings.end(),
                       [&](const Finding &f) {
                           return !(f.severity >= cfg_.minSeverity);
                       }),
        result.findings.end());

    std::stable_sort(result.findings.begin(), result.findings.end(),
                     [](const Finding &a, const Finding &b) {
                         return a.startByte < b.startByte;
                     });

    result.trace = traceOS.str();
    result.buffer = std::move(target);
    return result;
}

FileResult Scanner::scanFile(const std::string &path) const {
    FileResult result;
    result.path = path;

    const Language *lang = languageForPath(path);
    if (!lang) {
        result.skipReason = "no language for this file extension";
        return result;
    }

    uint64_t size = 0;
    if (cfg_.maxTargetBytes > 0 && !llvm::sys::fs::file_size(path, size) &&
        size > cfg_.maxTargetBytes) {
        result.skipReason = "larger than max_target_bytes (" +
                            std::to_string(size) + " > " +
                            std::to_string(cfg_.maxTargetBytes) + ")";
        return result;
    }

    auto bufOrErr = llvm::MemoryBuffer::getFile(path);
    if (!bufOrErr) {
        result.skipReason = "cannot read file: " + bufOrErr.getError().message();
        return result;
    }

    auto target = std::make_shared<const SourceBuffer>(
        BufferRole::Target, bufOrErr.get()->getBuffer().str(), cfg_.offsetUnit,
        path);
    return scanBuffer(std::move(target), *lang);
}

std::vector<FileResult>
Scanner::scanAll(const std::vector<std::string> &paths) const {
    unsigned maxWorkers = cfg_.jobs > 0
        ? cfg_.jobs
        : std::max(1u, std::thread::hardware_concurrency());
    std::counting_semaphore<> sem(maxWorkers);

    // A slot is taken before each worker starts, so at most maxWorkers
    // threads exist at once.
    std::vector<std::future<FileResult>> futures;
    futures.reserve(paths.size());
    for (const auto &path : paths) {
        sem.acquire();
        futures.push_back(std::async(std::launch::async,
            [this, &sem](const std::string &p) -> FileResult {
                FileResult r = scanFile(p);
                sem.release();
                return r;
            },
            path));
    }

    std::vector<FileResult> results;
    results.reserve(futures.size());
    for (auto &f : futures)
        results.push_back(f.get());
    return results;
}

llvm::Expected<std::vector<std::string>>
collectTargets(const std::vector<std::string> &roots) {
    std::vector<std::string> files;

    for (const auto &root : roots) {
        llvm::sys::fs::file_status st;
        if (std::error_code EC = llvm::sys::fs::status(root, st))
            return llvm::createFileError(root, EC);

        if (!llvm::sys::fs::is_directory(st)) {
            files.push_back(root);
            continue;
        }

        size_t firstOfRoot = files.size();
        std::error_code EC;
        for (llvm::sys::fs::recursive_directory_iterator it(root, EC), end;
             it != end && !EC; it.increment(EC)) {
            llvm::StringRef p = it->path();
            if (llvm::sys::fs::is_directory(p)) {
                if (isHidden(p))
                    it.no_push();
                continue;
            }
            if (isHidden(p) || isExpectationFile(p) || !languageForPath(p))
                continue;
            if (!llvm::sys::fs::is_regular_file(p))
                continue;
            files.push_back(p.str());
        }
        if (EC)
            return llvm::createFileError(root, EC);

        std::sort(files.begin() + static_cast<std::ptrdiff_t>(firstOfRoot),
                  files.end());
    }
    return files;
}

FixOutcome computeFixes(const FileResult &result) {
    FixOutcome out;
    if (!result.buffer)
        return out;

    std::vector<Edit> edits;
    std::vector<size_t> owners;
    for (size_t i = 0; i < result.findings.size(); ++i) {
        const Finding &f = result.findings[i];
        if (f.fixStatus != FixStatus::Rendered)
            continue;
        edits.push_back({f.range, f.fix});
        owners.push_back(i);
    }

    ApplyResult applied = applyEdits(*result.buffer, edits);
    for (size_t idx : applied.applied)
        out.spliced.push_back(owners[idx]);

    for (size_t idx : applied.skipped) {
        const Finding &f = result.findings[owners[idx]];
        llvm::errs() << "liftfix: warning: " << f.location.file << ":"
                     << f.location.line << ":" << f.location.column
                     << ": fix for " << f.ruleID
                     << " overlaps an earlier fix, skipped\n";
    }

    out.fixedText = std::move(applied.text);
    out.applied = static_cast<unsigned>(applied.applied.size());
    out.overlapped = static_cast<unsigned>(applied.skipped.size());
    return out;
}

void markApplied(FileResult &result, const FixOutcome &outcome) {
    for (size_t idx : outcome.spliced)
        result.findings[idx].fixApplied = true;
}

llvm::Error writeFixedFile(const std::string &path, const std::string &text) {
    std::error_code EC;
    llvm::raw_fd_ostream file(path, EC, llvm::sys::fs::OF_None);
    if (EC)
        return llvm::createFileError(path, EC);

    file << text;
    file.close();
    if (file.has_error()) {
        EC = file.error();
        file.clear_error();
        return llvm::createFileError(path, EC);
    }
    return llvm::Error::success();
}

std::optional<std::string> expectedFixedPath(const std::string &path) {
    llvm::SmallString<128> inner(path);
    std::string ext = llvm::sys::path::extension(path).str();
    llvm::sys::path::replace_extension(inner, "fixed" + ext);
    if (llvm::sys::fs::exists(inner))
        return inner.str().str();

    std::string outer = path + ".fixed";
    if (llvm::sys::fs::exists(outer))
        return outer;
    return std::nullopt;
}

std::optional<FixTestResult> runFixTest(const FileResult &result,
                                        const std::string &fixedText) {
    auto expected = expectedFixedPath(result.path);
    if (!expected)
        return std::nullopt;

    FixTestResult t;
    t.path = result.path;
    t.expectedPath = *expected;

    if (!result.scanned()) {
        t.detail = "not scanned: " + result.skipReason;
        return t;
    }

    auto bufOrErr = llvm::MemoryBuffer::getFile(*expected);
    if (!bufOrErr) {
        t.detail = "cannot read expectation: " + bufOrErr.getError().message();
        return t;
    }

    llvm::StringRef want = bufOrErr.get()->getBuffer();
    size_t line = firstDifferentLine(want, fixedText);
    if (line == 0) {
        t.passed = true;
        return t;
    }

    t.detail = "line " + std::to_string(line) + ": expected '" +
               lineAt(want, line - 1) + "', got '" +
               lineAt(fixedText, line - 1) + "'";
    return t;
}

void accumulate(RunSummary &summary, const FileResult &result) {
    if (!result.scanned()) {
        ++summary.filesSkipped;
        return;
    }
    ++summary.filesScanned;
    for (const auto &f : result.findings) {
        ++summary.findings;
        if (f.fixStatus == FixStatus::Rendered)
            ++summary.fixesRendered;
        else if (f.fixStatus == FixStatus::Failed)
            ++summary.fixesFailed;
    }
}

} // namespace liftfix
