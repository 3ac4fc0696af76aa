#pragma once

#include "objxfer/crc32c.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace objxfer {

/// Chunk sizes of a multi-request resumable upload must be a multiple of this.
constexpr size_t CHUNK_GRANULARITY = 256 * 1024;

/// Bytes of the stream head kept with a persisted session for the
/// content-identity check on resume.
constexpr size_t CONTENT_PREFIX_SIZE = 512;

/// Bounded byte channel between the caller producing object data and the
/// upload task slicing it into protocol-aligned ranges.
///
/// Every byte written is folded into a running CRC32C (and optionally MD5)
/// exactly once, so re-sliced or re-transmitted ranges never skew the
/// whole-object checksums. Bytes the server did not acknowledge are pushed
/// back with unshift() rather than dropped.
class ChunkPipeline {
public:
    /// @param high_watermark  write() blocks while more than this many bytes
    ///                        are buffered and no consumer demands more.
    /// @param compute_md5     Also maintain an MD5 digest of the input.
    explicit ChunkPipeline(size_t high_watermark = 16 * 1024 * 1024, bool compute_md5 = false);
    ~ChunkPipeline();

    ChunkPipeline(const ChunkPipeline&) = delete;
    ChunkPipeline& operator=(const ChunkPipeline&) = delete;

    // --- Producer side ---

    /// Append bytes. Throws TransferError(Cancelled) once cancelled and
    /// std::logic_error after close().
    void write(std::span<const uint8_t> data);
    void write(std::string_view data);

    /// Mark the end of the input stream.
    void close();

    /// Abort: wakes both sides; further waits return immediately.
    void cancel();

    // --- Consumer side ---

    /// Block until a byte is buffered or the input ended.
    /// Returns true if more data is (or will be) available.
    bool wait_for_data();

    /// Copy of the first `size` buffered bytes (fewer at end of stream),
    /// without consuming them.
    std::vector<uint8_t> peek(size_t size);

    /// Remove and return up to `limit` bytes. Waits until `limit` bytes are
    /// buffered or the input ended.
    std::vector<uint8_t> pull(size_t limit);

    /// Return bytes to the front of the buffer for re-transmission.
    void unshift(std::vector<uint8_t> data);

    /// Discard up to `count` bytes. Returns the number discarded.
    uint64_t skip(uint64_t count);

    bool closed() const;
    bool cancelled() const;
    size_t buffered() const;

    /// True once the input ended and the buffer is drained.
    bool exhausted() const;

    // --- Checksums over the input ---

    Crc32c crc32c() const;
    uint64_t total_written() const;

    /// Base64 MD5 of the whole input; empty unless enabled and closed.
    std::string md5_base64() const;

private:
    void throw_if_cancelled() const;
    std::vector<uint8_t> take_locked(size_t limit);

    mutable std::mutex mutex_;
    std::condition_variable data_cv_;
    std::condition_variable space_cv_;

    std::deque<std::vector<uint8_t>> segments_;
    size_t front_offset_ = 0;  // bytes of segments_.front() already consumed
    size_t buffered_ = 0;
    size_t high_watermark_;
    size_t demand_ = 0;  // bytes a blocked consumer is waiting for

    bool closed_ = false;
    bool cancelled_ = false;

    Crc32c crc_;
    uint64_t total_written_ = 0;
    EVP_MD_CTX* md5_ctx_ = nullptr;
    std::string md5_digest_;
};

}  // namespace objxfer
