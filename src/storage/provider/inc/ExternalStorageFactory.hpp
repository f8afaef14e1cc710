#pragma once

#include "ExternalStorage.hpp"
#include "UrlUtils.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Maps URI schemes to provider parsers and provider tags to builders.
class ExternalStorageFactory {
public:
    using UriParser = std::function<ExternalStorageConfig(const ParsedUrl&)>;
    using Builder = std::function<std::unique_ptr<ExternalStorage>(const ExternalStorageConfig&)>;

    static ExternalStorageFactory& instance();

    // A default provider also handles URIs with no scheme
    static void register_provider(StorageProvider provider,
                                  const std::string& scheme,
                                  UriParser parser,
                                  Builder builder,
                                  bool is_default = false);

    // Throws StorageError(UnknownProvider) for an unregistered scheme
    static ExternalStorageConfig parse_uri(const std::string& uri);

    // Throws StorageError(UnknownProvider) for an unregistered provider
    static std::unique_ptr<ExternalStorage> make_storage(const ExternalStorageConfig& conf);

    static std::unique_ptr<ExternalStorage> make_storage_from_uri(const std::string& uri);

    static std::vector<std::string> schemes();

private:
    std::map<std::string, UriParser> parsers_;
    std::map<StorageProvider, Builder> builders_;
    std::string default_scheme_;
    std::mutex mutex_;
};
