#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "chunkdrive/server/errors.hpp"

namespace chunkdrive::server
{

    struct TenantPaths
    {
        std::string tenant;
        std::filesystem::path root;
    };

    // True for a single path component that can name a file inside a tenant root.
    bool is_plain_file_name(std::string_view name) noexcept;

    // Data root layout: `uploads/` holds per-session scratch directories,
    // `storage/<tenant>/` holds finalized artifacts.
    class Filesystem
    {
    public:
        explicit Filesystem(std::filesystem::path root);

        std::filesystem::path uploads_root() const;

        TenantPaths prepare_tenant_paths(const std::string &tenant) const;

        // Resolves an existing regular file strictly below the tenant root.
        std::filesystem::path resolve_artifact(const TenantPaths &tenant, std::string_view requested) const;

    private:
        std::filesystem::path base_;

        std::filesystem::path sanitize(const std::filesystem::path &base, std::string_view requested) const;
    };

} // namespace chunkdrive::server
