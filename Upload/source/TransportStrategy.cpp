#include "TransportStrategy.hpp"

const char* TransportStrategyToString(TransportStrategy strategy) noexcept
{
    switch (strategy) {
    case TransportStrategy::SingleShotMultipart: return "single-shot multipart";
    case TransportStrategy::ResumableSession:    return "resumable session";
    }

    return "unknown";
}

TransportStrategy SelectTransportStrategy(std::uint64_t file_size, const UploadPolicy& policy) noexcept
{
    if (file_size >= policy.resumable_threshold)
        return TransportStrategy::ResumableSession;

    return TransportStrategy::SingleShotMultipart;
}
