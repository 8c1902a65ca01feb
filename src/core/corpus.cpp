#include "lineage/corpus.hpp"
#include "lineage/error.hpp"
#include "lineage/logging.hpp"
#include "lineage/thread_pool.hpp"
#include "lineage/util/text.hpp"

#include <algorithm>
#include <optional>
#include <set>
#include <system_error>

namespace fs = std::filesystem;

namespace lineage {

std::vector<fs::path> list_source_files(const fs::path& root,
                                        const std::vector<std::string>& extensions) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw CorpusError(ErrorCode::CORPUS_NOT_FOUND,
                          "Corpus root is not a directory: " + root.string(),
                          __func__, "Pass the folder that contains the scripts with --root");
    }

    std::set<std::string> wanted;
    for (const auto& ext : extensions) {
        std::string normalized = util::to_lower(util::trim(ext));
        if (normalized.empty()) continue;
        if (normalized[0] != '.') normalized.insert(normalized.begin(), '.');
        wanted.insert(normalized);
    }

    std::vector<fs::path> files;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw CorpusError(ErrorCode::CORPUS_NOT_FOUND,
                          "Cannot scan corpus root " + root.string() + ": " + ec.message(), __func__);
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("Error while scanning ", root.string(), ": ", ec.message());
            ec.clear();
            continue;
        }

        const fs::path& path = it->path();
        std::string name = path.filename().string();

        if (it->is_directory(ec)) {
            if (!name.empty() && name[0] == '.') {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) continue;

        if (wanted.count(util::to_lower(path.extension().string())) > 0) {
            files.push_back(path);
        }
    }

    std::sort(files.begin(), files.end());
    LOG_DEBUG("Found ", files.size(), " source files under ", root.string());
    return files;
}

Corpus Corpus::load(const fs::path& root, const std::vector<std::string>& extensions,
                    ThreadPool* pool) {
    std::vector<fs::path> paths = list_source_files(root, extensions);
    if (paths.empty()) {
        throw CorpusError(ErrorCode::EMPTY_CORPUS,
                          "No source files found under " + root.string(), __func__,
                          "Check the root folder and corpus.extensions");
    }

    std::vector<std::optional<std::string>> texts(paths.size());
    auto read_one = [&](size_t i) { texts[i] = util::read_text(paths[i]); };

    if (pool) {
        pool->parallel_for(0, paths.size(), read_one);
    } else {
        for (size_t i = 0; i < paths.size(); ++i) read_one(i);
    }

    Corpus corpus(root);
    for (size_t i = 0; i < paths.size(); ++i) {
        if (!texts[i]) {
            ++corpus.skipped_;
            continue;
        }
        corpus.add(paths[i], std::move(*texts[i]));
    }

    if (corpus.empty()) {
        throw CorpusError(ErrorCode::EMPTY_CORPUS,
                          "None of the " + std::to_string(paths.size()) +
                          " source files under " + root.string() + " could be read", __func__);
    }

    LOG_INFO("Loaded ", corpus.size(), " source files from ", root.string(),
             corpus.skipped_ ? " (" + std::to_string(corpus.skipped_) + " unreadable)" : "");
    return corpus;
}

void Corpus::add(const fs::path& path, std::string text) {
    auto [it, inserted] = by_path_.emplace(path.string(), files_.size());
    if (!inserted) {
        File& existing = files_[it->second];
        existing.lowered = util::to_lower(text);
        existing.text = std::move(text);
        return;
    }

    File file;
    file.path = path;
    file.lowered = util::to_lower(text);
    file.text = std::move(text);
    files_.push_back(std::move(file));
}

const Corpus::File* Corpus::find(const fs::path& path) const {
    auto it = by_path_.find(path.string());
    return it == by_path_.end() ? nullptr : &files_[it->second];
}

std::string Corpus::relative_path(const fs::path& path) const {
    if (root_.empty()) return path.generic_string();

    std::error_code ec;
    fs::path relative = fs::relative(path, root_, ec);
    if (ec || relative.empty()) return path.generic_string();
    return relative.generic_string();
}

} // namespace lineage
