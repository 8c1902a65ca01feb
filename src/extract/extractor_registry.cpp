#include "lineage/extract/extractor.hpp"
#include "lineage/extract/pipeline_extractor.hpp"
#include "lineage/extract/sas_extractor.hpp"
#include "lineage/extract/view_extractor.hpp"
#include "lineage/error.hpp"
#include "lineage/util/text.hpp"

namespace lineage {

ExtractorRegistry ExtractorRegistry::with_default_dialects() {
    ExtractorRegistry registry;
    registry.register_extractor(std::make_unique<PipelineExtractor>(), {".py", ".sql"});
    registry.register_extractor(std::make_unique<ViewExtractor>(), {".sql"});
    registry.register_extractor(std::make_unique<SasExtractor>(), {".sas"});
    return registry;
}

void ExtractorRegistry::register_extractor(std::unique_ptr<TableExtractor> extractor,
                                           const std::vector<std::string>& extensions) {
    LINEAGE_CHECK_ARGUMENT(extractor != nullptr, "Extractor must not be null");

    const TableExtractor* raw = extractor.get();
    owned_.push_back(std::move(extractor));

    for (const auto& ext : extensions) {
        by_extension_[normalize_extension(ext)].push_back(raw);
    }
    by_kind_.emplace(raw->kind(), raw);
}

std::vector<const TableExtractor*> ExtractorRegistry::for_extension(const std::string& extension) const {
    auto it = by_extension_.find(normalize_extension(extension));
    if (it == by_extension_.end()) return {};
    return it->second;
}

std::vector<const TableExtractor*> ExtractorRegistry::for_file(const std::filesystem::path& path) const {
    return for_extension(path.extension().string());
}

const TableExtractor* ExtractorRegistry::for_kind(WriterKind kind) const {
    auto it = by_kind_.find(kind);
    return it == by_kind_.end() ? nullptr : it->second;
}

std::vector<std::string> ExtractorRegistry::extensions() const {
    std::vector<std::string> result;
    result.reserve(by_extension_.size());
    for (const auto& [ext, extractors] : by_extension_) {
        result.push_back(ext);
    }
    return result;
}

std::string ExtractorRegistry::normalize_extension(const std::string& extension) {
    std::string ext = util::to_lower(util::trim(extension));
    if (!ext.empty() && ext[0] != '.') ext.insert(ext.begin(), '.');
    return ext;
}

} // namespace lineage
