#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <tuple>
#include <vector>

#include "FileStream.hpp"

// Forward-only sequence of chunks read from one file handle.
//
// Every call to Next() yields at most chunk_size bytes; an empty chunk means
// the file is exhausted. A reader can't be rewound: construct a new one with
// an explicit start offset instead.
class ChunkReader final
{
public:
    using Error = FileStream::Error;

public:
    ChunkReader(const std::filesystem::path& path, std::size_t chunk_size, std::uint64_t start_offset = 0);

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;

public:
    const std::filesystem::path& GetPath() const noexcept;
    std::uint64_t GetOffset() const noexcept;

public:
    std::optional<Error> Open() noexcept;

    // The returned view stays valid until the next call to Next() or Close().
    std::tuple<bool, std::string_view, Error> Next() noexcept;

    std::optional<Error> Close() noexcept;

private:
    FileStream file_;
    std::vector<char> buffer_;

    const std::uint64_t start_offset_;
    std::uint64_t offset_;
    bool exhausted_ = false;
};
