#include "tether/codec.hpp"
#include "tether/errors.hpp"
#include "tether/log.hpp"
#include <zlib.h>

namespace tether {
namespace codec {

std::string flatten(const value_t& v) {
    if (std::holds_alternative<entity_ptr>(v) || std::holds_alternative<collection_ptr>(v)) {
        throw codec_error(std::string("Cannot flatten a value of kind ") + value_kind_name(v));
    }
    return to_json(v).dump();
}

json restore_structured(const std::string& text) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        LOG_ERROR(log_tag::codec, "Malformed structured value: %s", e.what());
        throw codec_error(std::string("Malformed structured value: ") + e.what());
    }
}

blob_t compress(const value_t& v, int level) {
    std::string input;
    if (auto* s = std::get_if<std::string>(&v)) {
        input = *s;
    } else if (auto* b = std::get_if<blob_t>(&v)) {
        input.assign(b->begin(), b->end());
    } else if (is_null(v)) {
        input.clear();
    } else {
        input = to_display_string(v);
    }

    uLongf bound = compressBound(static_cast<uLong>(input.size()));
    blob_t out(bound);
    int rc = compress2(out.data(), &bound,
                       reinterpret_cast<const Bytef*>(input.data()),
                       static_cast<uLong>(input.size()), level);
    if (rc != Z_OK) {
        LOG_ERROR(log_tag::codec, "compress2 failed: %d", rc);
        throw codec_error("Compression failed (zlib error " + std::to_string(rc) + ")");
    }
    out.resize(bound);
    return out;
}

std::string decompress(const blob_t& bytes) {
    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
        throw codec_error("inflateInit failed");
    }

    stream.next_in = const_cast<Bytef*>(bytes.data());
    stream.avail_in = static_cast<uInt>(bytes.size());

    std::string out;
    char buffer[16384];
    int rc = Z_OK;
    do {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc == Z_BUF_ERROR) {
            // input exhausted before the end of the stream
            inflateEnd(&stream);
            throw codec_error("Decompression failed: truncated stream");
        }
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string msg = stream.msg ? stream.msg : "corrupt data";
            inflateEnd(&stream);
            LOG_ERROR(log_tag::codec, "inflate failed: %s", msg.c_str());
            throw codec_error("Decompression failed: " + msg);
        }
        out.append(buffer, sizeof(buffer) - stream.avail_out);
    } while (rc != Z_STREAM_END);

    inflateEnd(&stream);
    return out;
}

json to_json(const value_t& v) {
    return std::visit([](const auto& arg) -> json {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, blob_t>) {
            return json::binary(arg);
        } else if constexpr (std::is_same_v<T, entity_ptr> || std::is_same_v<T, collection_ptr>) {
            throw codec_error("Associations have no JSON form");
        } else {
            return arg;
        }
    }, v);
}

value_t from_json(const json& j) {
    switch (j.type()) {
        case json::value_t::null:
            return nullptr;
        case json::value_t::boolean:
            return j.get<bool>();
        case json::value_t::number_integer:
            return j.get<int64_t>();
        case json::value_t::number_unsigned:
            // CBOR stores non-negative integers unsigned
            return static_cast<int64_t>(j.get<uint64_t>());
        case json::value_t::number_float:
            return j.get<double>();
        case json::value_t::string:
            return j.get<std::string>();
        case json::value_t::binary:
            return blob_t(j.get_binary().begin(), j.get_binary().end());
        default:
            return j;
    }
}

} // namespace codec
} // namespace tether
