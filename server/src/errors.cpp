#include "chunkdrive/server/errors.hpp"

#include <sstream>

namespace chunkdrive::server
{

    namespace
    {

        std::string describe_indices(const std::vector<std::uint64_t> &indices)
        {
            std::ostringstream out;
            out << '[';
            for (std::size_t i = 0; i < indices.size(); ++i)
            {
                if (i > 0)
                {
                    out << ", ";
                }
                out << indices[i];
            }
            out << ']';
            return out.str();
        }

    } // namespace

    ServerError::ServerError(chunkdrive::ErrorCode code, std::string message)
        : std::runtime_error(std::move(message)), code_(code) {}

    UploadError UploadError::incomplete(std::vector<std::uint64_t> missing, std::vector<std::uint64_t> surplus)
    {
        std::string message = "Missing chunks: " + describe_indices(missing);
        if (!surplus.empty())
        {
            message += ", unexpected chunks: " + describe_indices(surplus);
        }
        UploadError error(chunkdrive::ErrorCode::IncompleteUpload, std::move(message));
        error.missing_ = std::move(missing);
        error.surplus_ = std::move(surplus);
        return error;
    }

    RangeError::RangeError(chunkdrive::ErrorCode code, std::string message, std::uint64_t artifact_length)
        : ServerError(code, std::move(message)), artifact_length_(artifact_length) {}

} // namespace chunkdrive::server
