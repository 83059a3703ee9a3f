// Scribble Graphics Tests
// software_device_test.cpp - Host-memory backend unit tests

#include <gtest/gtest.h>
#include <scribble/core/config.hpp>
#include <scribble/graphics/buffer.hpp>
#include <scribble/graphics/command_buffer.hpp>
#include <scribble/graphics/software_device.hpp>
#include <scribble/graphics/texture.hpp>

#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

namespace scribble::graphics::test {

namespace {

TextureDesc array_desc(uint32_t width, uint32_t height, uint32_t layers, TextureFormat format) {
    TextureDesc desc;
    desc.type = TextureType::Texture2DArray;
    desc.format = format;
    desc.width = width;
    desc.height = height;
    desc.array_layers = layers;
    desc.usage = TextureUsage::Sampled | TextureUsage::TransferSrc | TextureUsage::TransferDst;
    desc.debug_name = "test";
    return desc;
}

std::vector<uint8_t> read_back(SoftwareDevice& device, Texture* texture, uint32_t layer) {
    const uint32_t bpp = texture_format_bytes_per_pixel(texture->get_format());
    BufferDesc buffer_desc;
    buffer_desc.size = static_cast<size_t>(texture->get_width()) * texture->get_height() * bpp;
    buffer_desc.usage = BufferUsage::TransferDst;
    buffer_desc.host_visible = true;
    auto buffer = device.create_buffer(buffer_desc);

    BufferImageCopy region;
    region.texture_width = texture->get_width();
    region.texture_height = texture->get_height();
    region.array_layer = layer;

    auto cmd = device.create_command_buffer();
    cmd->begin();
    cmd->copy_texture_to_buffer(texture, buffer.get(), region);
    cmd->end();
    device.submit(cmd.get(), true);

    std::vector<uint8_t> bytes(buffer_desc.size);
    buffer->read(bytes.data(), bytes.size());
    return bytes;
}

}  // namespace

TEST(TextureFormatTest, BytesPerPixel) {
    EXPECT_EQ(texture_format_bytes_per_pixel(TextureFormat::R8Unorm), 1u);
    EXPECT_EQ(texture_format_bytes_per_pixel(TextureFormat::RGBA8UnormSrgb), 4u);
    EXPECT_EQ(texture_format_bytes_per_pixel(TextureFormat::RGBA32Float), 16u);
    EXPECT_EQ(texture_format_bytes_per_pixel(TextureFormat::NV12), 0u);
    EXPECT_EQ(texture_format_bytes_per_pixel(TextureFormat::Unknown), 0u);
}

TEST(TextureFormatTest, MultiPlanar) {
    EXPECT_TRUE(is_multi_planar(TextureFormat::NV12));
    EXPECT_TRUE(is_multi_planar(TextureFormat::P010));
    EXPECT_FALSE(is_multi_planar(TextureFormat::R8Unorm));
    EXPECT_FALSE(is_multi_planar(TextureFormat::RGBA8Unorm));
}

TEST(SoftwareDeviceTest, CapabilitiesFollowDesc) {
    SoftwareDeviceDesc desc;
    desc.max_texture_size_2d = 1024;
    desc.max_texture_array_layers = 8;
    auto device = create_software_device(desc);

    auto caps = device->get_capabilities();
    EXPECT_EQ(caps.max_texture_size_2d, 1024u);
    EXPECT_EQ(caps.max_texture_array_layers, 8u);
    EXPECT_STREQ(device->get_backend_name(), "Software");
}

TEST(SoftwareDeviceTest, DescFromConfig) {
    core::Config config;
    config.set_int(core::config_section::DEVICE, core::config_key::MAX_TEXTURE_SIZE, 4096);
    config.set_int(core::config_section::DEVICE, core::config_key::MAX_ARRAY_LAYERS, -3);

    auto desc = SoftwareDeviceDesc::from_config(config);
    EXPECT_EQ(desc.max_texture_size_2d, 4096u);
    EXPECT_EQ(desc.max_texture_array_layers, SoftwareDeviceDesc{}.max_texture_array_layers);
}

TEST(SoftwareDeviceTest, CreateTextureRespectsLimits) {
    SoftwareDeviceDesc desc;
    desc.max_texture_size_2d = 256;
    desc.max_texture_array_layers = 2;
    auto device = create_software_device(desc);

    EXPECT_NE(device->create_texture(array_desc(256, 256, 2, TextureFormat::R8Unorm)), nullptr);
    EXPECT_EQ(device->create_texture(array_desc(512, 256, 1, TextureFormat::R8Unorm)), nullptr);
    EXPECT_EQ(device->create_texture(array_desc(64, 64, 3, TextureFormat::R8Unorm)), nullptr);
    EXPECT_EQ(device->create_texture(array_desc(64, 64, 1, TextureFormat::NV12)), nullptr);
    EXPECT_EQ(device->get_stats().textures_created, 1u);
}

TEST(SoftwareDeviceTest, WriteTextureAndReadBack) {
    auto device = create_software_device();
    auto texture = device->create_texture(array_desc(4, 4, 2, TextureFormat::R8Unorm));
    ASSERT_NE(texture, nullptr);

    std::vector<uint8_t> texels = {1, 2, 3, 4, 5, 6};
    BufferImageCopy region;
    region.texture_offset_x = 1;
    region.texture_offset_y = 2;
    region.texture_width = 3;
    region.texture_height = 2;
    region.array_layer = 1;
    device->write_texture(texture.get(), region, texels);
    EXPECT_EQ(device->get_stats().texture_writes, 1u);

    auto layer0 = read_back(*device, texture.get(), 0);
    EXPECT_TRUE(std::all_of(layer0.begin(), layer0.end(), [](uint8_t v) { return v == 0; }));

    auto layer1 = read_back(*device, texture.get(), 1);
    EXPECT_EQ(layer1[2 * 4 + 1], 1);
    EXPECT_EQ(layer1[2 * 4 + 3], 3);
    EXPECT_EQ(layer1[3 * 4 + 1], 4);
    EXPECT_EQ(layer1[3 * 4 + 3], 6);
    EXPECT_EQ(layer1[0], 0);
}

TEST(SoftwareDeviceTest, WriteTextureRejectsShortData) {
    auto device = create_software_device();
    auto texture = device->create_texture(array_desc(4, 4, 1, TextureFormat::RGBA8Unorm));

    std::vector<uint8_t> texels(4 * 4 * 4 - 1);
    BufferImageCopy region;
    region.texture_width = 4;
    region.texture_height = 4;
    EXPECT_THROW(device->write_texture(texture.get(), region, texels), std::out_of_range);
}

TEST(SoftwareDeviceTest, WriteTextureRejectsOutOfBoundsRegion) {
    auto device = create_software_device();
    auto texture = device->create_texture(array_desc(4, 4, 1, TextureFormat::R8Unorm));

    std::vector<uint8_t> texels(16);
    BufferImageCopy region;
    region.texture_offset_x = 2;
    region.texture_width = 4;
    region.texture_height = 1;
    EXPECT_THROW(device->write_texture(texture.get(), region, texels), std::out_of_range);
}

TEST(SoftwareDeviceTest, CopyTextureBetweenArrays) {
    auto device = create_software_device();
    auto src = device->create_texture(array_desc(2, 2, 2, TextureFormat::R8Unorm));
    auto dst = device->create_texture(array_desc(4, 4, 3, TextureFormat::R8Unorm));

    for (uint32_t layer = 0; layer < 2; layer++) {
        std::vector<uint8_t> texels(4);
        std::iota(texels.begin(), texels.end(), static_cast<uint8_t>(10 * (layer + 1)));
        BufferImageCopy region;
        region.texture_width = 2;
        region.texture_height = 2;
        region.array_layer = layer;
        device->write_texture(src.get(), region, texels);
    }

    auto cmd = device->create_command_buffer();
    cmd->begin();
    TextureCopy copy;
    copy.width = 2;
    copy.height = 2;
    copy.layer_count = 2;
    cmd->copy_texture(src.get(), dst.get(), copy);
    cmd->end();

    // Nothing executes before submit
    EXPECT_EQ(read_back(*device, dst.get(), 1)[0], 0);

    device->submit(cmd.get());
    EXPECT_EQ(device->get_stats().texture_copies, 1u);

    auto layer0 = read_back(*device, dst.get(), 0);
    auto layer1 = read_back(*device, dst.get(), 1);
    EXPECT_EQ(layer0[0], 10);
    EXPECT_EQ(layer0[1], 11);
    EXPECT_EQ(layer0[4], 12);
    EXPECT_EQ(layer0[5], 13);
    EXPECT_EQ(layer1[0], 20);
    EXPECT_EQ(layer1[5], 23);
}

TEST(SoftwareDeviceTest, CopyTextureValidatesAtRecord) {
    auto device = create_software_device();
    auto mask = device->create_texture(array_desc(4, 4, 1, TextureFormat::R8Unorm));
    auto color = device->create_texture(array_desc(4, 4, 1, TextureFormat::RGBA8Unorm));
    auto small = device->create_texture(array_desc(2, 2, 1, TextureFormat::R8Unorm));

    auto cmd = device->create_command_buffer();
    TextureCopy copy;
    copy.width = 4;
    copy.height = 4;

    EXPECT_THROW(cmd->copy_texture(mask.get(), small.get(), copy), std::runtime_error);

    cmd->begin();
    EXPECT_THROW(cmd->copy_texture(mask.get(), color.get(), copy), std::invalid_argument);
    EXPECT_THROW(cmd->copy_texture(mask.get(), small.get(), copy), std::out_of_range);
    cmd->end();
}

TEST(SoftwareDeviceTest, SubmitWhileRecordingThrows) {
    auto device = create_software_device();
    auto cmd = device->create_command_buffer();
    cmd->begin();
    EXPECT_THROW(device->submit(cmd.get()), std::runtime_error);
}

TEST(SoftwareDeviceTest, BufferCopyAndBounds) {
    auto device = create_software_device();
    std::vector<uint8_t> initial = {1, 2, 3, 4};

    BufferDesc desc;
    desc.size = 4;
    desc.host_visible = true;
    desc.initial_data = initial.data();
    auto src = device->create_buffer(desc);
    desc.initial_data = nullptr;
    auto dst = device->create_buffer(desc);

    auto cmd = device->create_command_buffer();
    cmd->begin();
    cmd->copy_buffer(src.get(), dst.get(), 1, 0, 3);
    EXPECT_THROW(cmd->copy_buffer(src.get(), dst.get(), 2, 0, 3), std::out_of_range);
    cmd->end();
    device->submit(cmd.get());

    std::vector<uint8_t> out(4);
    dst->read(out.data(), out.size());
    EXPECT_EQ(out, (std::vector<uint8_t>{2, 3, 4, 0}));
    EXPECT_THROW(dst->read(out.data(), 5), std::out_of_range);

    BufferDesc empty;
    EXPECT_EQ(device->create_buffer(empty), nullptr);
}

}  // namespace scribble::graphics::test
