#pragma once

#include <filesystem>
#include <string>

namespace ingest::delivery {

/**
 * @brief Where one file's chunks go
 */
struct Destination {
    std::string url;
    std::string api_key;
    std::string store_id;   ///< Informational, logged with the job
};

/**
 * @brief Chooses the destination for a file
 *
 * Consulted once per file before the health check. Implementations are
 * called from several worker threads at once.
 */
class DestinationResolver {
public:
    virtual ~DestinationResolver() = default;
    virtual Destination resolve(const std::filesystem::path& file) = 0;
};

/// Every file goes to the configured endpoint
class StaticDestinationResolver : public DestinationResolver {
public:
    explicit StaticDestinationResolver(Destination destination)
        : destination_(std::move(destination)) {}

    Destination resolve(const std::filesystem::path&) override {
        return destination_;
    }

private:
    Destination destination_;
};

} // namespace ingest::delivery
