#include <gtest/gtest.h>

#include <dcmtk/config/osconfig.h>
#include <dcmtk/dcmdata/dctk.h>

#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "io/medical_loader.hpp"
#include "test_utils.hpp"

using namespace tissueseg;

namespace {

struct DicomSlice {
    Uint16 rows = 0;
    Uint16 cols = 0;
    Uint16 bits_allocated = 8;
    Uint16 bits_stored = 8;
    bool is_signed = false;
    int instance = 1;
    std::vector<Uint8> pixels8;
    std::vector<Uint16> pixels16;
};

// Secondary capture MONOCHROME2 file, explicit little endian.
void save_dicom(const std::string& path, const DicomSlice& s) {
    DcmFileFormat file;
    DcmDataset* ds = file.getDataset();

    char uid[100];
    ASSERT_TRUE(ds->putAndInsertString(DCM_SOPClassUID, UID_SecondaryCaptureImageStorage).good());
    ASSERT_TRUE(ds->putAndInsertString(DCM_SOPInstanceUID, dcmGenerateUniqueIdentifier(uid, SITE_INSTANCE_UID_ROOT)).good());
    ASSERT_TRUE(ds->putAndInsertString(DCM_InstanceNumber, std::to_string(s.instance).c_str()).good());
    ASSERT_TRUE(ds->putAndInsertString(DCM_PhotometricInterpretation, "MONOCHROME2").good());
    ASSERT_TRUE(ds->putAndInsertUint16(DCM_SamplesPerPixel, 1).good());
    ASSERT_TRUE(ds->putAndInsertUint16(DCM_Rows, s.rows).good());
    ASSERT_TRUE(ds->putAndInsertUint16(DCM_Columns, s.cols).good());
    ASSERT_TRUE(ds->putAndInsertUint16(DCM_BitsAllocated, s.bits_allocated).good());
    ASSERT_TRUE(ds->putAndInsertUint16(DCM_BitsStored, s.bits_stored).good());
    ASSERT_TRUE(ds->putAndInsertUint16(DCM_HighBit, static_cast<Uint16>(s.bits_stored - 1)).good());
    ASSERT_TRUE(ds->putAndInsertUint16(DCM_PixelRepresentation, s.is_signed ? 1 : 0).good());

    if (s.bits_allocated == 8) {
        ASSERT_TRUE(ds->putAndInsertUint8Array(DCM_PixelData, s.pixels8.data(),
                                               static_cast<unsigned long>(s.pixels8.size())).good());
    } else {
        ASSERT_TRUE(ds->putAndInsertUint16Array(DCM_PixelData, s.pixels16.data(),
                                                static_cast<unsigned long>(s.pixels16.size())).good());
    }

    const OFCondition st = file.saveFile(path.c_str(), EXS_LittleEndianExplicit);
    ASSERT_TRUE(st.good()) << st.text();
}

DicomSlice slice8(Uint16 rows, Uint16 cols, std::vector<Uint8> pixels, int instance = 1) {
    DicomSlice s;
    s.rows = rows;
    s.cols = cols;
    s.instance = instance;
    s.pixels8 = std::move(pixels);
    return s;
}

InputError::Kind load_error_kind(const std::string& path) {
    try {
        load_medical(path);
    } catch (const InputError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected InputError for " << path;
    return InputError::Kind::NotFound;
}

} // namespace

class DicomLoaderTest : public tissueseg::testing::TempDirTest {};

TEST_F(DicomLoaderTest, LoadsEightBitFile) {
    save_dicom(path("slice.dcm"), slice8(2, 3, {0, 15, 16, 60, 131, 255}));

    const Image im = load_medical(path("slice.dcm"));
    EXPECT_EQ(im.width, 3);
    EXPECT_EQ(im.height, 2);
    EXPECT_EQ(im.bits_allocated, 8);
    EXPECT_EQ(im.type, PixelType::U8);
    EXPECT_EQ(im.pixels, (std::vector<int32_t>{0, 15, 16, 60, 131, 255}));

    EXPECT_EQ(load_grayscale(path("slice.dcm")).pixels, (std::vector<uint8_t>{0, 15, 16, 60, 131, 255}));
}

TEST_F(DicomLoaderTest, LoadsTwelveBitStoredInSixteen) {
    DicomSlice s;
    s.rows = 1;
    s.cols = 4;
    s.bits_allocated = 16;
    s.bits_stored = 12;
    s.pixels16 = {0, 1000, 2047, 4095};
    save_dicom(path("ct.dcm"), s);

    const Image im = load_medical(path("ct.dcm"));
    EXPECT_EQ(im.bits_allocated, 16);
    EXPECT_EQ(im.bits_stored, 12);
    EXPECT_EQ(im.type, PixelType::U16);
    EXPECT_EQ(im.pixels, (std::vector<int32_t>{0, 1000, 2047, 4095}));
    EXPECT_EQ(to_gray8(im).pixels, (std::vector<uint8_t>{0, 62, 127, 255}));
}

TEST_F(DicomLoaderTest, SignedSixteenBitKeepsSign) {
    DicomSlice s;
    s.rows = 1;
    s.cols = 3;
    s.bits_allocated = 16;
    s.bits_stored = 16;
    s.is_signed = true;
    s.pixels16 = {static_cast<Uint16>(-1000), 0, 1000};
    save_dicom(path("signed.dcm"), s);

    const Image im = load_medical(path("signed.dcm"));
    EXPECT_TRUE(im.is_signed);
    EXPECT_EQ(im.type, PixelType::S16);
    EXPECT_EQ(im.pixels, (std::vector<int32_t>{-1000, 0, 1000}));
}

TEST_F(DicomLoaderTest, ShortPixelDataIsMalformed) {
    save_dicom(path("short.dcm"), slice8(4, 4, {1, 2, 3, 4, 5, 6, 7, 8}));
    EXPECT_EQ(load_error_kind(path("short.dcm")), InputError::Kind::Malformed);
}

TEST_F(DicomLoaderTest, ShortSixteenBitPixelDataIsMalformed) {
    DicomSlice s;
    s.rows = 2;
    s.cols = 2;
    s.bits_allocated = 16;
    s.bits_stored = 16;
    s.pixels16 = {1, 2};
    save_dicom(path("short16.dcm"), s);
    EXPECT_EQ(load_error_kind(path("short16.dcm")), InputError::Kind::Malformed);
}

TEST_F(DicomLoaderTest, SeriesDirectoryUsesLowestInstance) {
    std::filesystem::create_directory(dir_ / "series");
    save_dicom(path("series/b.dcm"), slice8(1, 2, {200, 200}, 2));
    save_dicom(path("series/a.dcm"), slice8(1, 2, {40, 100}, 1));
    write_file("series/notes.txt", std::string("not a dicom file"));

    const Image im = load_medical(path("series"));
    EXPECT_EQ(im.pixels, (std::vector<int32_t>{40, 100}));
}

TEST_F(DicomLoaderTest, SeriesSkipsSliceWithShortPixelData) {
    std::filesystem::create_directory(dir_ / "series");
    save_dicom(path("series/first.dcm"), slice8(2, 2, {1, 2}, 1));
    save_dicom(path("series/second.dcm"), slice8(1, 2, {70, 140}, 2));

    EXPECT_EQ(load_medical(path("series")).pixels, (std::vector<int32_t>{70, 140}));
}

TEST_F(DicomLoaderTest, EmptySeriesDirectoryIsEmpty) {
    std::filesystem::create_directory(dir_ / "series");
    EXPECT_EQ(load_error_kind(path("series")), InputError::Kind::Empty);
}

TEST_F(DicomLoaderTest, UnlistableSeriesDirectoryIsUnreadable) {
    namespace fs = std::filesystem;
    const fs::path series = dir_ / "locked";
    fs::create_directory(series);
    save_dicom((series / "a.dcm").string(), slice8(1, 1, {50}));
    fs::permissions(series, fs::perms::none);

    std::error_code ec;
    fs::directory_iterator listing(series, ec);
    if (!ec) {
        fs::permissions(series, fs::perms::owner_all);
        GTEST_SKIP() << "directory permissions are not enforced for this user";
    }

    const InputError::Kind kind = load_error_kind(series.string());
    fs::permissions(series, fs::perms::owner_all);
    EXPECT_EQ(kind, InputError::Kind::Unreadable);
}
