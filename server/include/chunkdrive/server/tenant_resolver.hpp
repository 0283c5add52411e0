#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "chunkdrive/server/config.hpp"

namespace chunkdrive::server
{

    // Maps the value of a request's Authorization header to the tenant that
    // owns the request, or nullopt when the request must be rejected.
    class TenantResolver
    {
    public:
        virtual ~TenantResolver() = default;

        virtual std::optional<std::string> resolve(std::string_view authorization) const = 0;
    };

    // Every request belongs to the same tenant.
    class SingleTenantResolver final : public TenantResolver
    {
    public:
        static constexpr std::string_view kDefaultTenant = "default";

        explicit SingleTenantResolver(std::string tenant = std::string(kDefaultTenant));

        std::optional<std::string> resolve(std::string_view authorization) const override;

    private:
        std::string tenant_;
    };

    // Bearer tokens looked up in a fixed table.
    class TokenTableResolver final : public TenantResolver
    {
    public:
        explicit TokenTableResolver(std::unordered_map<std::string, std::string> tokens);

        // Reads `{"tokens": {"<token>": "<tenant>"}}`. Throws std::runtime_error.
        static TokenTableResolver load(const std::filesystem::path &path);

        std::optional<std::string> resolve(std::string_view authorization) const override;

        std::size_t size() const noexcept { return tokens_.size(); }

    private:
        std::unordered_map<std::string, std::string> tokens_;
    };

    std::unique_ptr<TenantResolver> make_tenant_resolver(const ServerConfig &config);

} // namespace chunkdrive::server
