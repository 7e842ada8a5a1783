#pragma once

#include <string>

#include "core/ports/ITickSource.hpp"

namespace adapters::ticks {

// Hour-scoped tick cache on local disk, laid out like the provider's download tree:
//   <root>/<ASSET>/<YYYY>/<MM>/<DD>/<HH>h_ticks.csv   (MM is zero-based, 00 = January)
// Each file has a header and columns ms,bid,ask,volume where ms is the offset inside the
// hour; ask and volume may be empty.
class CsvTickCache : public core::ITickSource {
public:
    explicit CsvTickCache(std::string root);

    core::TickHour fetchHour(const domain::Asset& asset, domain::TimestampMs hourStart) override;

    std::string hourPath(const domain::Asset& asset, domain::TimestampMs hourStart) const;

private:
    std::string root_;
};

}  // namespace adapters::ticks
