#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include "sequence/frame.hpp"

namespace captionist::gif_codec {

struct DecodedGif {
    std::vector<Frame> frames;
    bool loop_forever = false;
};

DecodedGif decode_file(const std::filesystem::path& path);
DecodedGif decode_memory(const std::vector<unsigned char>& bytes);

// Repeat count of the NETSCAPE2.0 application extension (0 = forever), if present.
std::optional<int> read_loop_count(const std::vector<unsigned char>& bytes);

// loop_forever writes a NETSCAPE2.0 block with repeat count 0; otherwise no loop block is written.
void encode_file(const std::filesystem::path& path, const std::vector<Frame>& frames, bool loop_forever);

}
