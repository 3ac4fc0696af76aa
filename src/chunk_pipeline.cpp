#include "objxfer/chunk_pipeline.hpp"
#include "objxfer/errors.hpp"
#include "objxfer/net/http.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <stdexcept>

namespace objxfer {

ChunkPipeline::ChunkPipeline(size_t high_watermark, bool compute_md5)
    : high_watermark_(high_watermark) {
    if (compute_md5) {
        md5_ctx_ = EVP_MD_CTX_new();
        if (!md5_ctx_ || EVP_DigestInit_ex(md5_ctx_, EVP_md5(), nullptr) != 1) {
            if (md5_ctx_) EVP_MD_CTX_free(md5_ctx_);
            throw std::runtime_error("Cannot initialize MD5 digest");
        }
    }
}

ChunkPipeline::~ChunkPipeline() {
    if (md5_ctx_) EVP_MD_CTX_free(md5_ctx_);
}

void ChunkPipeline::throw_if_cancelled() const {
    if (cancelled_) {
        throw TransferError(ErrorKind::Cancelled, "Upload cancelled");
    }
}

// --- Producer side ---

void ChunkPipeline::write(std::span<const uint8_t> data) {
    if (data.empty()) return;

    std::unique_lock lock(mutex_);
    throw_if_cancelled();
    if (closed_) {
        throw std::logic_error("write() after close() on upload stream");
    }

    space_cv_.wait(lock, [this] {
        return cancelled_ || buffered_ < std::max(high_watermark_, demand_);
    });
    throw_if_cancelled();

    crc_.update(data);
    if (md5_ctx_) EVP_DigestUpdate(md5_ctx_, data.data(), data.size());
    total_written_ += data.size();

    segments_.emplace_back(data.begin(), data.end());
    buffered_ += data.size();
    data_cv_.notify_all();
}

void ChunkPipeline::write(std::string_view data) {
    write(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()), data.size()));
}

void ChunkPipeline::close() {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        closed_ = true;

        if (md5_ctx_) {
            unsigned char digest[EVP_MAX_MD_SIZE];
            unsigned int len = 0;
            EVP_DigestFinal_ex(md5_ctx_, digest, &len);
            md5_digest_ = net::base64_encode(std::vector<uint8_t>(digest, digest + len));
        }
    }
    data_cv_.notify_all();
}

void ChunkPipeline::cancel() {
    {
        std::lock_guard lock(mutex_);
        cancelled_ = true;
    }
    data_cv_.notify_all();
    space_cv_.notify_all();
}

// --- Consumer side ---

bool ChunkPipeline::wait_for_data() {
    std::unique_lock lock(mutex_);
    demand_ = std::max<size_t>(demand_, 1);
    space_cv_.notify_all();
    data_cv_.wait(lock, [this] { return cancelled_ || buffered_ > 0 || closed_; });
    demand_ = 0;
    throw_if_cancelled();
    return buffered_ > 0;
}

std::vector<uint8_t> ChunkPipeline::peek(size_t size) {
    std::unique_lock lock(mutex_);
    demand_ = size;
    space_cv_.notify_all();
    data_cv_.wait(lock, [this, size] { return cancelled_ || buffered_ >= size || closed_; });
    demand_ = 0;
    throw_if_cancelled();

    std::vector<uint8_t> out;
    out.reserve(std::min(size, buffered_));
    size_t skip = front_offset_;
    for (const auto& seg : segments_) {
        if (out.size() >= size) break;
        size_t take = std::min(seg.size() - skip, size - out.size());
        out.insert(out.end(), seg.begin() + static_cast<std::ptrdiff_t>(skip),
                   seg.begin() + static_cast<std::ptrdiff_t>(skip + take));
        skip = 0;
    }
    return out;
}

std::vector<uint8_t> ChunkPipeline::take_locked(size_t limit) {
    std::vector<uint8_t> out;
    out.reserve(std::min(limit, buffered_));

    while (out.size() < limit && !segments_.empty()) {
        auto& seg = segments_.front();
        size_t available = seg.size() - front_offset_;
        size_t take = std::min(available, limit - out.size());
        out.insert(out.end(), seg.begin() + static_cast<std::ptrdiff_t>(front_offset_),
                   seg.begin() + static_cast<std::ptrdiff_t>(front_offset_ + take));
        front_offset_ += take;
        if (front_offset_ == seg.size()) {
            segments_.pop_front();
            front_offset_ = 0;
        }
    }
    buffered_ -= out.size();
    return out;
}

std::vector<uint8_t> ChunkPipeline::pull(size_t limit) {
    std::unique_lock lock(mutex_);
    demand_ = limit;
    space_cv_.notify_all();
    data_cv_.wait(lock, [this, limit] { return cancelled_ || buffered_ >= limit || closed_; });
    demand_ = 0;
    throw_if_cancelled();

    auto out = take_locked(limit);
    space_cv_.notify_all();
    return out;
}

void ChunkPipeline::unshift(std::vector<uint8_t> data) {
    if (data.empty()) return;
    std::lock_guard lock(mutex_);
    if (front_offset_ > 0) {
        auto& front = segments_.front();
        front.erase(front.begin(), front.begin() + static_cast<std::ptrdiff_t>(front_offset_));
        front_offset_ = 0;
    }
    buffered_ += data.size();
    segments_.push_front(std::move(data));
    data_cv_.notify_all();
}

uint64_t ChunkPipeline::skip(uint64_t count) {
    uint64_t skipped = 0;
    while (skipped < count) {
        size_t step = static_cast<size_t>(std::min<uint64_t>(count - skipped, high_watermark_));
        auto discarded = pull(step);
        if (discarded.empty()) break;
        skipped += discarded.size();
    }
    return skipped;
}

bool ChunkPipeline::closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

bool ChunkPipeline::cancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
}

size_t ChunkPipeline::buffered() const {
    std::lock_guard lock(mutex_);
    return buffered_;
}

bool ChunkPipeline::exhausted() const {
    std::lock_guard lock(mutex_);
    return closed_ && buffered_ == 0;
}

// --- Checksums ---

Crc32c ChunkPipeline::crc32c() const {
    std::lock_guard lock(mutex_);
    return crc_;
}

uint64_t ChunkPipeline::total_written() const {
    std::lock_guard lock(mutex_);
    return total_written_;
}

std::string ChunkPipeline::md5_base64() const {
    std::lock_guard lock(mutex_);
    return md5_digest_;
}

}  // namespace objxfer
