/**
 * @file TestFixtures.cpp
 * @brief Shared helpers for the export tests
 */

#include "TestFixtures.hpp"
#include "core/SnapshotMapper.hpp"
#include <gdal_priv.h>
#include <cpl_string.h>
#include <atomic>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace qreport::test {

namespace fs = std::filesystem;

TempDirectory::TempDirectory() {
    static std::atomic<int> counter{0};
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            ("qreport_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    fs::create_directories(path_);
}

TempDirectory::~TempDirectory() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

std::string fake_jpeg(int width, int height) {
    std::string data;
    auto put = [&data](int byte) { data += static_cast<char>(byte & 0xFF); };

    put(0xFF); put(0xD8);                               // SOI
    put(0xFF); put(0xC0);                               // SOF0
    put(0x00); put(0x11);                               // length 17
    put(0x08);                                          // precision
    put(height >> 8); put(height);
    put(width >> 8); put(width);
    put(0x03);                                          // components
    for (int c = 1; c <= 3; ++c) {
        put(c); put(0x11); put(0x00);
    }
    put(0xFF); put(0xD9);                               // EOI
    return data;
}

std::string write_fake_jpeg(const fs::path& path) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << fake_jpeg();
    if (!out) {
        throw std::runtime_error("Cannot write test photo " + path.string());
    }
    return path.string();
}

std::string write_decodable_jpeg(const fs::path& path, int width, int height) {
    GDALAllRegister();
    fs::create_directories(path.parent_path());

    GDALDriver* mem_driver = GetGDALDriverManager()->GetDriverByName("MEM");
    GDALDriver* jpeg_driver = GetGDALDriverManager()->GetDriverByName("JPEG");
    if (!mem_driver || !jpeg_driver) {
        throw std::runtime_error("GDAL MEM or JPEG driver not available");
    }

    GDALDataset* raster = mem_driver->Create("", width, height, 3, GDT_Byte, nullptr);
    if (!raster) {
        throw std::runtime_error("Cannot create MEM raster");
    }

    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height);
    uint32_t seed = 12345;
    for (int band = 1; band <= 3; ++band) {
        for (int y = 0; y < height; ++y) {
            for (int x = 0; x < width; ++x) {
                seed = seed * 1103515245u + 12345u;
                int noise = static_cast<int>((seed >> 16) & 0x3F);
                pixels[static_cast<size_t>(y) * width + x] =
                    static_cast<uint8_t>((x * band + y * 2 + noise) & 0xFF);
            }
        }
        CPLErr err = raster->GetRasterBand(band)->RasterIO(GF_Write, 0, 0, width, height,
                                                           pixels.data(), width, height,
                                                           GDT_Byte, 0, 0);
        if (err != CE_None) {
            GDALClose(raster);
            throw std::runtime_error("Cannot fill MEM raster");
        }
    }

    char** options = CSLSetNameValue(nullptr, "QUALITY", "95");
    GDALDataset* jpeg = jpeg_driver->CreateCopy(path.string().c_str(), raster, FALSE, options,
                                                nullptr, nullptr);
    CSLDestroy(options);
    GDALClose(raster);
    if (!jpeg) {
        throw std::runtime_error("Cannot write test JPEG " + path.string());
    }
    GDALClose(jpeg);
    return path.string();
}

int raster_width(const fs::path& path) {
    GDALAllRegister();
    GDALDataset* dataset = static_cast<GDALDataset*>(GDALOpen(path.string().c_str(), GA_ReadOnly));
    if (!dataset) {
        return -1;
    }
    int width = dataset->GetRasterXSize();
    GDALClose(dataset);
    return width;
}

CheckupSnapshot sample_snapshot(const fs::path& photo_dir) {
    CheckupRecordSet records;
    records.checkup.id = "a1b2c3d4-e5f6-7890-abcd-ef0123456789";
    records.checkup.status = "COMPLETED";
    records.checkup.created_at = std::chrono::system_clock::now();
    records.checkup.header.client_company = "Acme Robotics S.p.A.";
    records.checkup.header.contact_person = "Laura Bianchi";
    records.checkup.header.site = "Plant 2";
    records.checkup.header.technician_name = "Marco Rossi";
    records.checkup.header.technician_company = "Service Tech";
    records.checkup.header.equipment_type = "Robotic Welding Island";
    records.checkup.header.serial_number = "RW-2024-0042";
    records.checkup.header.model = "RW-500";
    records.checkup.header.operating_hours = 12450;

    CheckItemRecord estop;
    estop.id = "item-1";
    estop.module_key = "SAFETY_SYSTEMS";
    estop.module_name = "Safety Systems";
    estop.description = "Emergency stop button";
    estop.status = CheckItemStatus::OK;
    estop.criticality = CriticalityLevel::CRITICAL;
    estop.notes = "Tested both stations";
    estop.order_index = 0;

    CheckItemRecord curtain;
    curtain.id = "item-2";
    curtain.module_key = "SAFETY_SYSTEMS";
    curtain.module_name = "Safety Systems";
    curtain.description = "Light curtain alignment";
    curtain.status = CheckItemStatus::NOK;
    curtain.criticality = CriticalityLevel::CRITICAL;
    curtain.notes = "Receiver misaligned by 3mm";
    curtain.order_index = 1;

    CheckItemRecord pump;
    pump.id = "item-3";
    pump.module_key = "HYDRAULICS";
    pump.module_name = "Hydraulics";
    pump.description = "Pump pressure";
    pump.status = CheckItemStatus::OK;
    pump.criticality = CriticalityLevel::IMPORTANT;
    pump.order_index = 0;

    records.items = {estop, curtain, pump};

    PhotoRecord estop_photo;
    estop_photo.id = "photo-1";
    estop_photo.check_item_id = "item-1";
    estop_photo.file_path = write_fake_jpeg(photo_dir / "IMG_0001.jpg");
    estop_photo.file_name = "IMG_0001.jpg";
    estop_photo.caption = "Station A";
    estop_photo.taken_at = records.checkup.created_at;

    PhotoRecord curtain_photo;
    curtain_photo.id = "photo-2";
    curtain_photo.check_item_id = "item-2";
    curtain_photo.file_path = write_fake_jpeg(photo_dir / "IMG_0002.jpg");
    curtain_photo.file_name = "IMG_0002.jpg";
    curtain_photo.caption = "Receiver";
    curtain_photo.taken_at = records.checkup.created_at;

    records.photos = {estop_photo, curtain_photo};

    SparePart receiver;
    receiver.part_number = "LC-RX-200";
    receiver.description = "Light curtain receiver bracket";
    receiver.quantity = 1;
    receiver.urgency = SparePartUrgency::CRITICAL;
    receiver.estimated_cost = 85.5;
    records.spare_parts = {receiver};

    return SnapshotMapper::from_records(records);
}

ExportOptions test_options(std::initializer_list<ExportFormat> formats) {
    ExportOptions options;
    options.formats = formats;
    options.photo_quality = PhotoQuality::ORIGINAL;
    options.create_timestamped_directory = false;
    return options;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

int count_files(const fs::path& directory, const std::string& extension) {
    int count = 0;
    std::error_code ec;
    for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file() && it->path().extension() == extension) {
            ++count;
        }
    }
    return count;
}

} // namespace qreport::test
