#include "sequence/gif_codec.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

#include <gif_lib.h>
#include <stb_image.h>

#include "utils/log.hpp"

namespace captionist::gif_codec {

namespace {

constexpr int kDefaultFrameDuration = 100;
constexpr int kMaxPaletteSize = 256;
constexpr std::size_t kBucketCount = 1u << 15;

std::vector<unsigned char> read_bytes(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || !std::filesystem::is_regular_file(path, ec)) {
        throw std::runtime_error("GIF file '" + path.string() + "' does not exist");
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Unable to open GIF file '" + path.string() + "'");
    }
    in.seekg(0, std::ios::end);
    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size <= 0) {
        throw std::runtime_error("GIF file '" + path.string() + "' is empty");
    }
    std::vector<unsigned char> bytes(static_cast<std::size_t>(size));
    if (!in.read(reinterpret_cast<char*>(bytes.data()), size)) {
        throw std::runtime_error("Failed reading GIF file '" + path.string() + "'");
    }
    return bytes;
}

struct StbDeleter {
    void operator()(void* data) const { if (data) stbi_image_free(data); }
};

struct GifWriter {
    GifFileType* gif = nullptr;

    ~GifWriter() {
        if (gif) {
            int error = 0;
            EGifCloseFile(gif, &error);
        }
    }

    [[noreturn]] void fail(const std::string& what) {
        const int error = gif ? gif->Error : 0;
        std::ostringstream oss;
        oss << "GIF encode failed (" << what << ")";
        if (const char* message = GifErrorString(error)) {
            oss << ": " << message;
        }
        throw std::runtime_error(oss.str());
    }

    void close() {
        int error = 0;
        GifFileType* handle = gif;
        gif = nullptr;
        if (EGifCloseFile(handle, &error) == GIF_ERROR) {
            std::ostringstream oss;
            oss << "GIF encode failed (close)";
            if (const char* message = GifErrorString(error)) {
                oss << ": " << message;
            }
            throw std::runtime_error(oss.str());
        }
    }
};

struct IndexedFrame {
    std::vector<GifColorType> palette;
    std::vector<GifByteType> indices;
};

int palette_size_for(int colors) {
    int size = 2;
    while (size < colors) {
        size <<= 1;
    }
    return size;
}

bool build_exact_palette(const Frame& frame, IndexedFrame& out) {
    SDL_Surface* surface = frame.surface();
    const int w = surface->w;
    const int h = surface->h;
    std::unordered_map<Uint32, GifByteType> lookup;
    out.indices.resize(static_cast<std::size_t>(w) * static_cast<std::size_t>(h));
    out.palette.clear();
    const auto* pixels = static_cast<const Uint8*>(surface->pixels);
    for (int y = 0; y < h; ++y) {
        const Uint8* row = pixels + static_cast<std::size_t>(y) * surface->pitch;
        for (int x = 0; x < w; ++x) {
            const Uint8 r = row[x * 3 + 0];
            const Uint8 g = row[x * 3 + 1];
            const Uint8 b = row[x * 3 + 2];
            const Uint32 key = (static_cast<Uint32>(r) << 16) | (static_cast<Uint32>(g) << 8) | b;
            auto it = lookup.find(key);
            if (it == lookup.end()) {
                if (static_cast<int>(out.palette.size()) >= kMaxPaletteSize) {
                    return false;
                }
                const auto index = static_cast<GifByteType>(out.palette.size());
                out.palette.push_back(GifColorType{r, g, b});
                it = lookup.emplace(key, index).first;
            }
            out.indices[static_cast<std::size_t>(y) * w + x] = it->second;
        }
    }
    return true;
}

// Popularity quantizer: the most used RGB555 buckets (averaged) become the palette and
// every bucket maps to its nearest palette entry.
void quantize_frame(const Frame& frame, IndexedFrame& out) {
    SDL_Surface* surface = frame.surface();
    const int w = surface->w;
    const int h = surface->h;
    const auto* pixels = static_cast<const Uint8*>(surface->pixels);
    const auto bucket_of = [](Uint8 r, Uint8 g, Uint8 b) {
        return (static_cast<std::size_t>(r >> 3) << 10) | (static_cast<std::size_t>(g >> 3) << 5) | (b >> 3);
    };

    struct Bucket {
        std::uint64_t count = 0;
        std::uint64_t r = 0;
        std::uint64_t g = 0;
        std::uint64_t b = 0;
    };
    std::vector<Bucket> buckets(kBucketCount);
    for (int y = 0; y < h; ++y) {
        const Uint8* row = pixels + static_cast<std::size_t>(y) * surface->pitch;
        for (int x = 0; x < w; ++x) {
            Bucket& bucket = buckets[bucket_of(row[x * 3], row[x * 3 + 1], row[x * 3 + 2])];
            ++bucket.count;
            bucket.r += row[x * 3];
            bucket.g += row[x * 3 + 1];
            bucket.b += row[x * 3 + 2];
        }
    }

    std::vector<std::size_t> used;
    for (std::size_t i = 0; i < buckets.size(); ++i) {
        if (buckets[i].count > 0) {
            used.push_back(i);
        }
    }
    const std::size_t keep = std::min<std::size_t>(used.size(), kMaxPaletteSize);
    std::partial_sort(used.begin(), used.begin() + keep, used.end(),
                      [&](std::size_t a, std::size_t b) { return buckets[a].count > buckets[b].count; });

    out.palette.clear();
    for (std::size_t i = 0; i < keep; ++i) {
        const Bucket& bucket = buckets[used[i]];
        out.palette.push_back(GifColorType{static_cast<GifByteType>(bucket.r / bucket.count),
                                           static_cast<GifByteType>(bucket.g / bucket.count),
                                           static_cast<GifByteType>(bucket.b / bucket.count)});
    }

    std::vector<int> mapping(kBucketCount, -1);
    const auto nearest = [&](std::size_t key) {
        const int r = static_cast<int>((key >> 10) & 0x1F) * 8 + 4;
        const int g = static_cast<int>((key >> 5) & 0x1F) * 8 + 4;
        const int b = static_cast<int>(key & 0x1F) * 8 + 4;
        int best = 0;
        int best_distance = std::numeric_limits<int>::max();
        for (std::size_t i = 0; i < out.palette.size(); ++i) {
            const int dr = r - out.palette[i].Red;
            const int dg = g - out.palette[i].Green;
            const int db = b - out.palette[i].Blue;
            const int distance = dr * dr + dg * dg + db * db;
            if (distance < best_distance) {
                best_distance = distance;
                best = static_cast<int>(i);
            }
        }
        return best;
    };

    out.indices.resize(static_cast<std::size_t>(w) * static_cast<std::size_t>(h));
    for (int y = 0; y < h; ++y) {
        const Uint8* row = pixels + static_cast<std::size_t>(y) * surface->pitch;
        for (int x = 0; x < w; ++x) {
            const std::size_t key = bucket_of(row[x * 3], row[x * 3 + 1], row[x * 3 + 2]);
            if (mapping[key] < 0) {
                mapping[key] = nearest(key);
            }
            out.indices[static_cast<std::size_t>(y) * w + x] = static_cast<GifByteType>(mapping[key]);
        }
    }
}

IndexedFrame index_frame(const Frame& frame) {
    IndexedFrame indexed;
    if (!build_exact_palette(frame, indexed)) {
        quantize_frame(frame, indexed);
    }
    const int padded = palette_size_for(static_cast<int>(indexed.palette.size()));
    indexed.palette.resize(static_cast<std::size_t>(padded), GifColorType{0, 0, 0});
    return indexed;
}

void write_loop_extension(GifWriter& writer) {
    static const char kNetscape[] = "NETSCAPE2.0";
    const unsigned char loop_block[3] = {1, 0, 0};
    if (EGifPutExtensionLeader(writer.gif, APPLICATION_EXT_FUNC_CODE) == GIF_ERROR ||
        EGifPutExtensionBlock(writer.gif, 11, kNetscape) == GIF_ERROR ||
        EGifPutExtensionBlock(writer.gif, 3, loop_block) == GIF_ERROR ||
        EGifPutExtensionTrailer(writer.gif) == GIF_ERROR) {
        writer.fail("loop extension");
    }
}

void write_frame(GifWriter& writer, const Frame& frame) {
    IndexedFrame indexed = index_frame(frame);

    GraphicsControlBlock gcb{};
    gcb.DisposalMode = DISPOSE_DO_NOT;
    gcb.UserInputFlag = false;
    gcb.DelayTime = std::max(0, (frame.duration() + 5) / 10);
    gcb.TransparentColor = NO_TRANSPARENT_COLOR;
    GifByteType extension[4];
    const size_t extension_len = EGifGCBToExtension(&gcb, extension);
    if (EGifPutExtension(writer.gif, GRAPHICS_EXT_FUNC_CODE, static_cast<int>(extension_len), extension) == GIF_ERROR) {
        writer.fail("graphics control block");
    }

    ColorMapObject* map = GifMakeMapObject(static_cast<int>(indexed.palette.size()), indexed.palette.data());
    if (!map) {
        writer.fail("colour map");
    }
    const int put_desc = EGifPutImageDesc(writer.gif, 0, 0, frame.width(), frame.height(), false, map);
    GifFreeMapObject(map);
    if (put_desc == GIF_ERROR) {
        writer.fail("image descriptor");
    }

    for (int y = 0; y < frame.height(); ++y) {
        GifByteType* row = indexed.indices.data() + static_cast<std::size_t>(y) * frame.width();
        if (EGifPutLine(writer.gif, row, frame.width()) == GIF_ERROR) {
            writer.fail("pixel data");
        }
    }
}

std::size_t skip_sub_blocks(const std::vector<unsigned char>& bytes, std::size_t pos) {
    while (pos < bytes.size()) {
        const std::size_t len = bytes[pos];
        pos += 1;
        if (len == 0) {
            return pos;
        }
        pos += len;
    }
    return bytes.size();
}

}

std::optional<int> read_loop_count(const std::vector<unsigned char>& bytes) {
    if (bytes.size() < 13 || std::memcmp(bytes.data(), "GIF", 3) != 0) {
        return std::nullopt;
    }
    std::size_t pos = 13;
    const unsigned char screen_flags = bytes[10];
    if (screen_flags & 0x80) {
        pos += 3u * (1u << ((screen_flags & 0x07) + 1));
    }
    while (pos < bytes.size()) {
        const unsigned char introducer = bytes[pos];
        if (introducer == 0x21) {
            if (pos + 2 >= bytes.size()) {
                return std::nullopt;
            }
            const unsigned char label = bytes[pos + 1];
            std::size_t block = pos + 2;
            if (label == 0xFF && block + 12 <= bytes.size() && bytes[block] == 11 &&
                (std::memcmp(&bytes[block + 1], "NETSCAPE2.0", 11) == 0 ||
                 std::memcmp(&bytes[block + 1], "ANIMEXTS1.0", 11) == 0)) {
                const std::size_t sub = block + 12;
                if (sub + 3 < bytes.size() && bytes[sub] >= 3 && bytes[sub + 1] == 1) {
                    return static_cast<int>(bytes[sub + 2]) | (static_cast<int>(bytes[sub + 3]) << 8);
                }
            }
            pos = skip_sub_blocks(bytes, block);
        } else if (introducer == 0x2C) {
            // Loop extensions precede the first image.
            return std::nullopt;
        } else {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

DecodedGif decode_memory(const std::vector<unsigned char>& bytes) {
    if (bytes.empty()) {
        throw std::runtime_error("GIF data is empty");
    }
    int width = 0, height = 0, layers = 0, comp = 0;
    int* delays_raw = nullptr;
    std::unique_ptr<stbi_uc, StbDeleter> data(
        stbi_load_gif_from_memory(bytes.data(), static_cast<int>(bytes.size()), &delays_raw,
                                  &width, &height, &layers, &comp, STBI_rgb_alpha));
    std::unique_ptr<int, StbDeleter> delays(delays_raw);
    if (!data || width <= 0 || height <= 0 || layers <= 0) {
        const char* reason = stbi_failure_reason();
        throw std::runtime_error(std::string("Failed to decode GIF frames: ") + (reason ? reason : "unknown error"));
    }

    DecodedGif decoded;
    decoded.frames.reserve(static_cast<std::size_t>(layers));
    const std::size_t frame_bytes = static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 4;
    for (int i = 0; i < layers; ++i) {
        const int duration = delays ? delays.get()[i] : kDefaultFrameDuration;
        decoded.frames.push_back(Frame::from_rgba(data.get() + frame_bytes * static_cast<std::size_t>(i),
                                                  width, height, duration));
    }
    const std::optional<int> loop_count = read_loop_count(bytes);
    decoded.loop_forever = loop_count.has_value() && *loop_count == 0;
    return decoded;
}

DecodedGif decode_file(const std::filesystem::path& path) {
    DecodedGif decoded = decode_memory(read_bytes(path));
    log::debug("[GifCodec] Decoded " + std::to_string(decoded.frames.size()) + " frames from " + path.string());
    return decoded;
}

void encode_file(const std::filesystem::path& path, const std::vector<Frame>& frames, bool loop_forever) {
    if (frames.empty()) {
        throw std::runtime_error("Cannot encode an empty sequence to '" + path.string() + "'");
    }
    int screen_w = 0;
    int screen_h = 0;
    for (const Frame& frame : frames) {
        screen_w = std::max(screen_w, frame.width());
        screen_h = std::max(screen_h, frame.height());
    }

    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec && !std::filesystem::exists(parent)) {
            throw std::runtime_error("Failed to create directory '" + parent.string() + "': " + ec.message());
        }
    }

    GifWriter writer;
    int error = 0;
    writer.gif = EGifOpenFileName(path.string().c_str(), false, &error);
    if (!writer.gif) {
        std::ostringstream oss;
        oss << "Unable to open '" << path.string() << "' for writing";
        if (const char* message = GifErrorString(error)) {
            oss << ": " << message;
        }
        throw std::runtime_error(oss.str());
    }
    EGifSetGifVersion(writer.gif, true);
    if (EGifPutScreenDesc(writer.gif, screen_w, screen_h, 8, 0, nullptr) == GIF_ERROR) {
        writer.fail("screen descriptor");
    }
    if (loop_forever) {
        write_loop_extension(writer);
    }
    for (const Frame& frame : frames) {
        write_frame(writer, frame);
    }
    writer.close();
    log::debug("[GifCodec] Encoded " + std::to_string(frames.size()) + " frames to " + path.string());
}

}
