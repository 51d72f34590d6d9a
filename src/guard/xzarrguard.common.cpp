#include "macros.hh"
#include "xzarrguard.common.hh"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace {
bool
is_unreserved(unsigned char c)
{
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

int
hex_value(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return -1;
}
} // namespace

std::string
xzarrguard::trim(std::string_view s)
{
    if (s.empty()) {
        return {};
    }

    // trim left
    std::string trimmed(s);
    trimmed.erase(trimmed.begin(),
                  std::find_if(trimmed.begin(), trimmed.end(), [](char c) {
                      return !std::isspace(static_cast<unsigned char>(c));
                  }));

    // trim right
    trimmed.erase(std::find_if(trimmed.rbegin(),
                               trimmed.rend(),
                               [](char c) {
                                   return !std::isspace(
                                     static_cast<unsigned char>(c));
                               })
                    .base(),
                  trimmed.end());

    return trimmed;
}

bool
xzarrguard::is_empty_string(std::string_view s, std::string_view err_on_empty)
{
    auto trimmed = trim(s);
    if (trimmed.empty()) {
        LOG_ERROR(err_on_empty);
        return true;
    }
    return false;
}

std::string
xzarrguard::percent_encode(std::string_view s)
{
    static constexpr char digits[] = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(s.size());
    for (char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        if (is_unreserved(c)) {
            encoded.push_back(ch);
        } else {
            encoded.push_back('%');
            encoded.push_back(digits[c >> 4]);
            encoded.push_back(digits[c & 0x0F]);
        }
    }

    return encoded;
}

std::string
xzarrguard::percent_decode(std::string_view s)
{
    std::string decoded;
    decoded.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '%') {
            decoded.push_back(s[i]);
            continue;
        }

        EXPECT_STATUS(i + 2 < s.size(),
                      XzgStatusCode_InvalidArgument,
                      "Truncated escape in '",
                      s,
                      "'");
        const int hi = hex_value(s[i + 1]);
        const int lo = hex_value(s[i + 2]);
        EXPECT_STATUS(hi >= 0 && lo >= 0,
                      XzgStatusCode_InvalidArgument,
                      "Invalid escape in '",
                      s,
                      "' at offset ",
                      i);
        decoded.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }

    return decoded;
}

uint64_t
xzarrguard::chunks_along_dimension(uint64_t array_size, uint64_t chunk_size)
{
    EXPECT_STATUS(
      chunk_size > 0, XzgStatusCode_InvalidShape, "Invalid chunk size.");

    return array_size / chunk_size + (array_size % chunk_size != 0);
}

size_t
xzarrguard::bytes_of_type(XzgDataType data_type)
{
    switch (data_type) {
        case XzgDataType_int8:
        case XzgDataType_uint8:
            return 1;
        case XzgDataType_int16:
        case XzgDataType_uint16:
            return 2;
        case XzgDataType_int32:
        case XzgDataType_uint32:
        case XzgDataType_float32:
            return 4;
        case XzgDataType_int64:
        case XzgDataType_uint64:
        case XzgDataType_float64:
            return 8;
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

const char*
xzarrguard::data_type_to_string(XzgDataType data_type)
{
    switch (data_type) {
        case XzgDataType_uint8:
            return "uint8";
        case XzgDataType_uint16:
            return "uint16";
        case XzgDataType_uint32:
            return "uint32";
        case XzgDataType_uint64:
            return "uint64";
        case XzgDataType_int8:
            return "int8";
        case XzgDataType_int16:
            return "int16";
        case XzgDataType_int32:
            return "int32";
        case XzgDataType_int64:
            return "int64";
        case XzgDataType_float32:
            return "float32";
        case XzgDataType_float64:
            return "float64";
        default:
            throw std::invalid_argument("Invalid data type: " +
                                        std::to_string(data_type));
    }
}

XzgDataType
xzarrguard::data_type_from_string(std::string_view name)
{
    for (int i = 0; i < XzgDataTypeCount; ++i) {
        const auto data_type = static_cast<XzgDataType>(i);
        if (name == data_type_to_string(data_type)) {
            return data_type;
        }
    }

    EXPECT_STATUS(false,
                  XzgStatusCode_InvalidArgument,
                  "Unsupported data type '",
                  name,
                  "'");
    return XzgDataTypeCount; // unreachable
}

std::string
xzarrguard::to_string(const ChunkCoordinate& coord)
{
    std::string out = "(";
    for (size_t i = 0; i < coord.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += std::to_string(coord[i]);
    }
    out += ")";
    return out;
}

const char*
xzarrguard::status_code_name(XzgStatusCode code)
{
    switch (code) {
        case XzgStatusCode_Success:
            return "Success";
        case XzgStatusCode_InvalidArgument:
            return "InvalidArgument";
        case XzgStatusCode_InvalidCoordinate:
            return "InvalidCoordinate";
        case XzgStatusCode_InvalidShape:
            return "InvalidShape";
        case XzgStatusCode_ManifestCorrupt:
            return "ManifestCorrupt";
        case XzgStatusCode_StoreUnreadable:
            return "StoreUnreadable";
        case XzgStatusCode_UnsupportedStrategy:
            return "UnsupportedStrategy";
        case XzgStatusCode_IOError:
            return "IOError";
        case XzgStatusCode_CompressionError:
            return "CompressionError";
        case XzgStatusCode_InternalError:
            return "InternalError";
        default:
            return "Unknown";
    }
}
