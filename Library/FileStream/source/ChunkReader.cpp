#include "ChunkReader.hpp"

ChunkReader::ChunkReader(const std::filesystem::path& path, std::size_t chunk_size, std::uint64_t start_offset)
    : file_(path)
    , buffer_(chunk_size)
    , start_offset_(start_offset)
    , offset_(start_offset)
{
}

const std::filesystem::path& ChunkReader::GetPath() const noexcept
{
    return file_.GetPath();
}

std::uint64_t ChunkReader::GetOffset() const noexcept
{
    return offset_;
}

std::optional<ChunkReader::Error> ChunkReader::Open() noexcept
{
    if (buffer_.empty())
        return Error{ -1, "open: chunk size must be positive" };

    if (auto err = file_.Open(std::ios::binary | std::ios::in))
        return err;

    if (start_offset_ == 0)
        return std::nullopt;

    if (auto err = file_.Seek(start_offset_)) {
        (void)file_.Close();
        return err;
    }

    return std::nullopt;
}

std::tuple<bool, std::string_view, ChunkReader::Error> ChunkReader::Next() noexcept
{
    if (exhausted_)
        return { true, std::string_view{}, Error{} };

    std::size_t filled = 0;

    // fstream may return short reads, so keep going until the chunk is full
    while (filled < buffer_.size()) {
        auto [ok, n, err] = file_.Read(buffer_.data() + filled,
                                       static_cast<std::streamsize>(buffer_.size() - filled));
        if (!ok)
            return { false, std::string_view{}, err };

        if (n <= 0) {
            exhausted_ = true;
            break;
        }

        filled += static_cast<std::size_t>(n);
    }

    offset_ += filled;

    return { true, std::string_view(buffer_.data(), filled), Error{} };
}

std::optional<ChunkReader::Error> ChunkReader::Close() noexcept
{
    return file_.Close();
}
