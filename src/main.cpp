// Scribble - GPU texture atlas
// main.cpp - Atlas benchmark entry point

#include <scribble/atlas/atlas.hpp>
#include <scribble/core/config.hpp>
#include <scribble/core/file_io.hpp>
#include <scribble/core/logger.hpp>
#include <scribble/graphics/software_device.hpp>
#include <scribble/rendering/texture_cache.hpp>

#include <cstdint>
#include <filesystem>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";

// Distinct glyphs the synthetic text cycles through, so later frames hit the cache
constexpr uint32_t GLYPH_SET_SIZE = 512;

struct BenchSettings {
    int frames = 60;
    int glyphs_per_frame = 64;
    int glyph_size = 24;
};

BenchSettings read_bench_settings(const scribble::core::Config& config) {
    using namespace scribble::core;
    BenchSettings settings;
    settings.frames = config.get_int(config_section::BENCH, config_key::FRAMES, settings.frames);
    settings.glyphs_per_frame =
        config.get_int(config_section::BENCH, config_key::GLYPHS_PER_FRAME, settings.glyphs_per_frame);
    settings.glyph_size = config.get_int(config_section::BENCH, config_key::GLYPH_SIZE, settings.glyph_size);
    return settings;
}

// Deterministic coverage pattern for a synthetic glyph
std::vector<uint8_t> make_glyph_pixels(uint32_t id, uint32_t width, uint32_t height, uint32_t bytes_per_pixel) {
    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * bytes_per_pixel);
    for (size_t i = 0; i < pixels.size(); i++) {
        pixels[i] = static_cast<uint8_t>((i * 31 + id * 17) & 0xFF);
    }
    return pixels;
}

void log_atlas(const char* name, const scribble::atlas::AtlasStorage& storage) {
    SCRIBBLE_LOG_INFO(scribble::core::log_category::ATLAS, "{}: {} layers of {}x{}, {} tiles, {} px allocated", name,
                      storage.get_layer_count(), storage.get_size().x, storage.get_size().y,
                      storage.get_tile_count(), storage.get_allocated_area());
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace scribble;

    // Configuration, optionally from a JSON file given on the command line
    core::Config config;
    if (argc > 1) {
        config.load_or_create_default(std::filesystem::path(argv[1]));
    }

    core::LoggerConfig log_config;
    auto level =
        core::parse_log_level(config.get_string(core::config_section::LOGGING, core::config_key::LEVEL, "info"));
    if (level) {
        log_config.console_level = *level;
    }
    log_config.log_filename =
        config.get_string(core::config_section::LOGGING, core::config_key::FILE, "scribble.log");
    log_config.log_directory = core::FileSystem::get_temp_directory();
    core::Logger::initialize(log_config);

    SCRIBBLE_LOG_INFO(core::log_category::ENGINE, "Scribble atlas bench v{}", VERSION);
    if (!level) {
        SCRIBBLE_LOG_WARN(core::log_category::CONFIG, "Unknown log level, using info");
    }

    const BenchSettings settings = read_bench_settings(config);
    if (settings.frames <= 0 || settings.glyphs_per_frame <= 0 || settings.glyph_size <= 0) {
        SCRIBBLE_LOG_ERROR(core::log_category::CONFIG, "Bench settings must be positive");
        core::Logger::shutdown();
        return 1;
    }

    auto device = graphics::create_software_device(graphics::SoftwareDeviceDesc::from_config(config));

    int exit_code = 0;
    try {
        rendering::TextureCache cache(device.get(), atlas::LayeredAtlasDesc::from_config(config));

        // A large image held for the whole run, split into tiles
        const uint32_t image_width = 600;
        const uint32_t image_height = 400;
        auto image_pixels = make_glyph_pixels(0, image_width, image_height, 4);
        auto background = cache.allocate_image("background", {image_pixels, image_width, image_height});

        size_t cache_hits = 0;
        size_t quads = 0;
        uint32_t rebinds = 0;
        std::vector<rendering::CachedTexture> previous_glyphs;

        for (int frame = 0; frame < settings.frames; frame++) {
            std::vector<rendering::CachedTexture> frame_glyphs;
            frame_glyphs.reserve(static_cast<size_t>(settings.glyphs_per_frame));
            atlas::TextureMesh text_mesh;
            atlas::TextureMesh emoji_mesh;

            glm::vec2 pen(0.0f, static_cast<float>(settings.glyph_size));
            for (int i = 0; i < settings.glyphs_per_frame; i++) {
                // Half of each frame's text repeats the previous frame
                const auto glyph_id =
                    static_cast<uint32_t>(frame * (settings.glyphs_per_frame / 2) + i) % GLYPH_SET_SIZE;
                const auto key = rendering::GlyphCacheKey::make(0, static_cast<uint16_t>(glyph_id),
                                                                static_cast<float>(settings.glyph_size));
                const auto content =
                    glyph_id % 16 == 0 ? rendering::GlyphContent::Color : rendering::GlyphContent::Mask;

                auto glyph = cache.find_glyph(key, content);
                if (glyph) {
                    cache_hits++;
                } else {
                    const uint32_t width = static_cast<uint32_t>(settings.glyph_size) / 2 + glyph_id % 8;
                    const uint32_t height = static_cast<uint32_t>(settings.glyph_size);
                    const uint32_t bpp = content == rendering::GlyphContent::Color ? 4 : 1;
                    auto pixels = make_glyph_pixels(glyph_id, width, height, bpp);
                    rendering::GlyphPlacement placement{width, height, 1, static_cast<int32_t>(height) - 4};
                    glyph = cache.allocate_glyph(key, content, placement, pixels);
                }

                auto quad = cache.glyph_to_mesh(pen, glyph, content);
                quads += quad.vertices.size() / 4;
                if (content == rendering::GlyphContent::Color) {
                    emoji_mesh.append(quad);
                } else {
                    text_mesh.append(quad);
                }
                pen.x += static_cast<float>(glyph->get_width() + 1);
                frame_glyphs.push_back(std::move(glyph));
            }

            auto image_mesh =
                background->to_mesh(atlas::Box2D{{0.0f, 0.0f}, {300.0f, 200.0f}}, cache.get_color_atlas());
            quads += image_mesh.vertices.size() / 4;

            if (cache.needs_rebinding()) {
                SCRIBBLE_LOG_DEBUG(core::log_category::CACHE, "Frame {}: rebinding atlas textures", frame);
                cache.mark_bound();
                rebinds++;
            }

            // Keep this frame's glyphs for one more frame, older ones are reclaimed
            previous_glyphs = std::move(frame_glyphs);
            cache.collect_garbage();
        }

        SCRIBBLE_LOG_INFO(core::log_category::ENGINE, "{} frames, {} quads, {} cache hits, {} rebinds",
                          settings.frames, quads, cache_hits, rebinds);
        log_atlas("Mask atlas", cache.get_mask_atlas().get_storage());
        log_atlas("Color atlas", cache.get_color_atlas().get_storage());

        const auto& stats = device->get_stats();
        SCRIBBLE_LOG_INFO(core::log_category::GRAPHICS,
                          "Device: {} textures created, {} texel writes, {} texture copies, {} submits",
                          stats.textures_created, stats.texture_writes, stats.texture_copies, stats.submits);
    } catch (const atlas::AtlasError& e) {
        SCRIBBLE_LOG_CRITICAL(core::log_category::ENGINE, "Atlas failure: {}", e.what());
        exit_code = 1;
    }

    core::Logger::shutdown();
    return exit_code;
}
