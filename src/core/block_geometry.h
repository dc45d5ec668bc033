#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/// A byte range as asked for by the client. last == -1 means open-ended
/// ("bytes=first-").
struct RequestedRange {
    int64_t first = 0;
    int64_t last = -1;

    bool isOpen() const { return last < 0; }
};

/// One block the plan needs, with its position inside the object.
struct PlannedBlock {
    int64_t index = 0;
    int64_t offset = 0;   // index * block_size
    int64_t length = 0;   // block_size, or the remainder for the final block
};

/// Blocks needed to satisfy one request, in ascending index order.
struct BlockPlan {
    int64_t object_size = 0;
    int64_t block_size = 0;
    bool partial = false;        // a Range was requested (206 rather than 200)
    int64_t first_byte = 0;      // resolved inclusive byte range
    int64_t last_byte = -1;
    int64_t trim_start = 0;      // offset into the first block
    int64_t trim_end = -1;       // inclusive offset into the last block
    std::vector<PlannedBlock> blocks;

    bool empty() const { return blocks.empty(); }

    /// Bytes the response body will carry.
    int64_t contentLength() const { return blocks.empty() ? 0 : last_byte - first_byte + 1; }
};

/// Parse the values of all Range header fields of a request.
///
/// @return std::nullopt when there is no Range field.
/// @throws RangeNotSatisfiable when the header is present but malformed:
///         more than one field, a unit other than "bytes", a suffix range
///         ("bytes=-n"), a range list, non-numeric bounds, or last < first.
std::optional<RequestedRange> parseRangeHeader(const std::vector<std::string>& values);

/// Number of blocks an object of @p object_size bytes occupies.
int64_t blockCount(int64_t object_size, int64_t block_size);

/// Length of block @p index of an object; the final block holds the remainder.
int64_t blockLength(int64_t object_size, int64_t block_size, int64_t index);

/// Index of the block holding the first requested byte. Usable before the
/// object size is known, to choose the block that discovers it.
int64_t firstBlockIndex(int64_t block_size, const std::optional<RequestedRange>& range);

/// Map an object size, a block size and an optional range to a BlockPlan.
///
/// Without a range the plan spans every block of the object. With a range,
/// the first block is floor(first / block_size), the last block is
/// floor(last / block_size), trim_start = first mod block_size and
/// trim_end = last mod block_size.
///
/// @throws std::invalid_argument when block_size <= 0 or object_size < 0.
/// @throws RangeNotSatisfiable when first >= object_size or last >= object_size.
BlockPlan planBlocks(int64_t object_size,
                     int64_t block_size,
                     const std::optional<RequestedRange>& range);
