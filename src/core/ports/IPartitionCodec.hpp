#pragma once

#include <string>
#include <vector>

#include "domain/Types.hpp"

namespace core {

// Whole-file encoder/decoder for one partition file. The store owns paths, locking and
// atomic replacement; a codec only turns bars into bytes on disk and back.
class IPartitionCodec {
public:
    virtual ~IPartitionCodec() = default;

    // Throws fxb::CorruptPartitionError when the file exists but cannot be decoded.
    virtual std::vector<domain::Bar> read(const std::string& path) = 0;

    // Writes bars (already sorted, unique) to path, creating or truncating it.
    virtual void write(const std::string& path, const std::vector<domain::Bar>& bars) = 0;
};

}  // namespace core
