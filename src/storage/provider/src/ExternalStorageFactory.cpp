#include "ExternalStorageFactory.hpp"
#include "StorageError.hpp"
#include "StringUtils.hpp"
#include <stdexcept>

const char* storage_provider_to_string(StorageProvider provider) {
    switch (provider) {
        case StorageProvider::Workload: return "workload";
        default: return "unknown";
    }
}

ExternalStorageFactory& ExternalStorageFactory::instance() {
    static ExternalStorageFactory inst;
    return inst;
}

void ExternalStorageFactory::register_provider(StorageProvider provider,
                                               const std::string& scheme,
                                               UriParser parser,
                                               Builder builder,
                                               bool is_default) {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(inst.mutex_);
    const std::string key = StringUtils::to_lower(scheme);
    inst.parsers_[key] = std::move(parser);
    inst.builders_[provider] = std::move(builder);
    if (is_default) {
        inst.default_scheme_ = key;
    }
}

ExternalStorageConfig ExternalStorageFactory::parse_uri(const std::string& uri) {
    ParsedUrl url;
    try {
        url = UrlUtils::parse(uri);
    } catch (const std::invalid_argument& e) {
        throw StorageError(StorageErrorCode::MalformedPath, "invalid URI " + uri + ": " + e.what());
    }

    UriParser parser;
    {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        const std::string scheme = url.scheme.empty() ? inst.default_scheme_ : StringUtils::to_lower(url.scheme);
        auto it = inst.parsers_.find(scheme);
        if (it == inst.parsers_.end()) {
            throw StorageError(StorageErrorCode::UnknownProvider,
                               "unsupported storage scheme: \"" + url.scheme + "\"");
        }
        parser = it->second;
    }
    return parser(url);
}

std::unique_ptr<ExternalStorage> ExternalStorageFactory::make_storage(const ExternalStorageConfig& conf) {
    Builder builder;
    {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        auto it = inst.builders_.find(conf.provider);
        if (it == inst.builders_.end()) {
            throw StorageError(StorageErrorCode::UnknownProvider,
                               std::string("no storage provider registered for ") +
                               storage_provider_to_string(conf.provider));
        }
        builder = it->second;
    }
    return builder(conf);
}

std::unique_ptr<ExternalStorage> ExternalStorageFactory::make_storage_from_uri(const std::string& uri) {
    return make_storage(parse_uri(uri));
}

std::vector<std::string> ExternalStorageFactory::schemes() {
    auto& inst = instance();
    std::lock_guard<std::mutex> lock(inst.mutex_);
    std::vector<std::string> result;
    for (const auto& [scheme, _] : inst.parsers_) {
        result.push_back(scheme);
    }
    return result;
}
