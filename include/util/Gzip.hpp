#pragma once

#include <string>
#include <string_view>

namespace strata::util {

// gzip framing (RFC 1952) over zlib. Both directions throw CodecError.
class Gzip {
public:
    static std::string compress(std::string_view data);
    static std::string decompress(std::string_view data);

    /// True if data starts with the gzip magic bytes.
    static bool has_gzip_header(std::string_view data);
};

}  // namespace strata::util
