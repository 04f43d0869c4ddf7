// SPDX-License-Identifier: Apache-2.0
// framing.hpp - 4-byte big-endian length-prefixed records (replay files)
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace duel::framing {

inline constexpr uint32_t kMaxFrameBytes = 10'000'000;

inline std::string build_frame(const std::string &payload)
{
    uint32_t len = static_cast<uint32_t>(payload.size());
    uint32_t net = htonl(len);
    std::string frame;
    frame.resize(4 + payload.size());
    std::memcpy(frame.data(), &net, 4);
    std::memcpy(frame.data() + 4, payload.data(), payload.size());
    return frame;
}

enum class ExtractResult
{
    frame, // one payload written to out
    need_more, // buffer holds a partial frame
    invalid // length prefix is zero or over kMaxFrameBytes; the stream cannot be resynchronized
};

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};
    bool broken{false};

    void feed(const char *data, size_t n)
    {
        buffer.insert(buffer.end(), data, data + n);
    }
};

inline ExtractResult try_extract(FrameParseState &st, std::string &out)
{
    if (st.broken)
        return ExtractResult::invalid;
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return ExtractResult::need_more;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > kMaxFrameBytes) {
            st.broken = true;
            return ExtractResult::invalid;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return ExtractResult::need_more;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return ExtractResult::frame;
}

} // namespace duel::framing
