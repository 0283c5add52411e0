#include "chunkdrive/server/tenant_resolver.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "chunkdrive/server/filesystem.hpp"

namespace chunkdrive::server
{

    namespace
    {
        constexpr std::string_view kBearerPrefix = "Bearer ";
    } // namespace

    SingleTenantResolver::SingleTenantResolver(std::string tenant) : tenant_(std::move(tenant)) {}

    std::optional<std::string> SingleTenantResolver::resolve(std::string_view) const
    {
        return tenant_;
    }

    TokenTableResolver::TokenTableResolver(std::unordered_map<std::string, std::string> tokens)
        : tokens_(std::move(tokens))
    {
    }

    TokenTableResolver TokenTableResolver::load(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            throw std::runtime_error("Failed to open token file: " + path.string());
        }

        nlohmann::json json;
        try
        {
            in >> json;
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            throw std::runtime_error("Malformed token file " + path.string() + ": " + ex.what());
        }

        const auto it = json.find("tokens");
        if (!json.is_object() || it == json.end() || !it->is_object())
        {
            throw std::runtime_error("Token file must contain a \"tokens\" object: " + path.string());
        }

        std::unordered_map<std::string, std::string> tokens;
        for (const auto &[token, tenant] : it->items())
        {
            if (!tenant.is_string())
            {
                throw std::runtime_error("Tenant for a token must be a string: " + path.string());
            }
            auto name = tenant.get<std::string>();
            if (token.empty() || !is_plain_file_name(name) || name.front() == '.')
            {
                throw std::runtime_error("Invalid token entry for tenant '" + name + "'");
            }
            tokens.emplace(token, std::move(name));
        }
        return TokenTableResolver(std::move(tokens));
    }

    std::optional<std::string> TokenTableResolver::resolve(std::string_view authorization) const
    {
        if (authorization.substr(0, kBearerPrefix.size()) != kBearerPrefix)
        {
            return std::nullopt;
        }
        auto token = authorization.substr(kBearerPrefix.size());
        while (!token.empty() && token.front() == ' ')
        {
            token.remove_prefix(1);
        }
        while (!token.empty() && token.back() == ' ')
        {
            token.remove_suffix(1);
        }
        const auto it = tokens_.find(std::string(token));
        if (it == tokens_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::unique_ptr<TenantResolver> make_tenant_resolver(const ServerConfig &config)
    {
        if (!config.tokens_file)
        {
            spdlog::info("Single-tenant mode, tenant '{}'", SingleTenantResolver::kDefaultTenant);
            return std::make_unique<SingleTenantResolver>();
        }
        auto resolver = TokenTableResolver::load(*config.tokens_file);
        spdlog::info("Loaded {} bearer token(s) from {}", resolver.size(), config.tokens_file->string());
        return std::make_unique<TokenTableResolver>(std::move(resolver));
    }

} // namespace chunkdrive::server
