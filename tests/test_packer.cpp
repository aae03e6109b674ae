#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <bigarc/archive.hpp>
#include <bigarc/packer.hpp>

#include <gtest/gtest.h>

namespace fs = std::filesystem;

namespace {

using Bytes = std::vector<uint8_t>;
using NamedBytes = std::vector<std::pair<std::string, Bytes>>;

Bytes toBytes(std::string_view text) {
  return Bytes(text.begin(), text.end());
}

bigarc::PackSettings settingsFor(bigarc::Kind kind,
                                 bigarc::EntryOrder ordering = bigarc::EntryOrder::Path) {
  bigarc::PackSettings settings;
  settings.kind = kind;
  settings.ordering = ordering;
  return settings;
}

std::vector<std::string> namesInTableOrder(const bigarc::Archive &archive) {
  std::vector<std::string> names;
  auto entries = archive.readEntryList();
  if (entries) {
    for (const auto &entry : *entries) {
      names.push_back(entry.name);
    }
  }
  return names;
}

// Source whose length is known but whose bytes can never be read
class BrokenSource : public bigarc::ByteSource {
public:
  uint64_t length() const override { return 4; }

  bool copyTo(std::span<uint8_t>, const std::string &name,
              bigarc::Error *outError) const override {
    if (outError) {
      outError->code = bigarc::ErrorCode::Io;
      outError->message = "device unplugged";
      outError->name = name;
    }
    return false;
  }
};

} // namespace

class PackerTest : public ::testing::Test {
protected:
  void SetUp() override {
    tempDir_ = fs::temp_directory_path() / "bigarc_test_packer";
    fs::create_directories(tempDir_);
  }

  void TearDown() override { fs::remove_all(tempDir_); }

  fs::path createTestFile(const fs::path &relative, const std::string &content) {
    fs::path filePath = tempDir_ / relative;
    fs::create_directories(filePath.parent_path());
    std::ofstream file(filePath, std::ios::binary);
    file.write(content.data(), content.size());
    return filePath;
  }

  std::string readTestFile(const fs::path &filePath) {
    std::ifstream file(filePath, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  }

  fs::path tempDir_;
};

// Layout

TEST_F(PackerTest, ExactBytesForSingleEntry) {
  auto packed = bigarc::pack({{"a", toBytes("xy")}}, settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(packed.has_value());

  // table = 8 + 1 + 1 = 10, data_start = 26, total = 28
  Bytes expected = {'B', 'I', 'G', 'F', 0x1C, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x01,
                    0x00, 0x00, 0x00, 0x1A, 0x00, 0x00, 0x00, 0x1A, 0x00, 0x00, 0x00, 0x02,
                    'a',  0x00, 'x',  'y'};
  EXPECT_EQ(*packed, expected);
}

TEST_F(PackerTest, Big4Magic) {
  auto packed = bigarc::pack({{"a", toBytes("1")}}, settingsFor(bigarc::Kind::Big4));
  ASSERT_TRUE(packed.has_value());
  EXPECT_EQ(std::string(packed->begin(), packed->begin() + 4), "BIG4");
}

TEST_F(PackerTest, HeaderArithmetic) {
  NamedBytes entries = {{"data/ini/object.ini", Bytes(100, 'o')},
                        {"art/textures/unit.dds", Bytes(7, 't')},
                        {"readme", {}}};

  bigarc::PackSettings settings = settingsFor(bigarc::Kind::BigF);
  settings.secretData = toBytes("easage0.0.1");

  bigarc::Error error;
  auto packed = bigarc::pack(entries, settings, &error);
  ASSERT_TRUE(packed.has_value()) << error.message;

  size_t tableSize = 0;
  size_t payload = 0;
  for (const auto &[name, data] : entries) {
    tableSize += 8 + name.size() + 1;
    payload += data.size();
  }

  auto archive = bigarc::Archive::fromBytes(*packed);
  ASSERT_TRUE(archive.has_value());
  EXPECT_EQ(archive->readDataStart(), 16 + tableSize + settings.secretData->size());
  EXPECT_EQ(archive->readTotalSize(), 16 + tableSize + settings.secretData->size() + payload);
  EXPECT_EQ(archive->readTotalSize(), packed->size());
  EXPECT_EQ(archive->readEntryCount(), 3u);
}

TEST_F(PackerTest, LayoutMatchesBuild) {
  bigarc::Packer packer;
  packer.addData(toBytes("12345"), "b.txt");
  packer.addData(toBytes("abc"), "a.txt");

  bigarc::Error error;
  auto layout = packer.layout(settingsFor(bigarc::Kind::BigF), &error);
  ASSERT_TRUE(layout.has_value()) << error.message;

  EXPECT_EQ(layout->tableSize, 2u * (8 + 5 + 1));
  EXPECT_EQ(layout->dataStart, 16u + layout->tableSize);
  EXPECT_EQ(layout->totalSize, layout->dataStart + 8u);
  ASSERT_EQ(layout->records.size(), 2u);
  EXPECT_EQ(layout->records[0].name, "a.txt");
  EXPECT_EQ(layout->records[0].offset, layout->dataStart);
  EXPECT_EQ(layout->records[1].offset, layout->dataStart + 3u);

  auto archive = packer.buildArchive(settingsFor(bigarc::Kind::BigF), &error);
  ASSERT_TRUE(archive.has_value()) << error.message;
  EXPECT_EQ(archive->size(), layout->totalSize);
}

TEST_F(PackerTest, OffsetsAreContiguous) {
  NamedBytes entries = {{"z", Bytes(13, 1)}, {"y", Bytes(0, 2)}, {"x", Bytes(250, 3)},
                        {"w", Bytes(1, 4)}};
  auto packed = bigarc::pack(entries, settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(packed.has_value());

  auto archive = bigarc::Archive::fromBytes(*packed);
  ASSERT_TRUE(archive.has_value());
  auto list = archive->readEntryList();
  auto dataStart = archive->readDataStart();
  ASSERT_TRUE(list.has_value());
  ASSERT_TRUE(dataStart.has_value());
  ASSERT_EQ(list->size(), 4u);

  EXPECT_EQ((*list)[0].offset, *dataStart);
  for (size_t i = 0; i + 1 < list->size(); ++i) {
    EXPECT_EQ((*list)[i].offset + (*list)[i].length, (*list)[i + 1].offset);
  }
  EXPECT_EQ(list->back().offset + list->back().length, packed->size());
}

// Round trip

TEST_F(PackerTest, RoundTrip) {
  NamedBytes entries = {{"first/entry.txt", {0, 1, 2, 3}},
                        {"second/entry/bar.txt", {0, 9, 8, 7}},
                        {"third.bin", Bytes(1024, 0xAB)},
                        {"empty", {}}};

  for (auto kind : {bigarc::Kind::Big4, bigarc::Kind::BigF}) {
    bigarc::Error error;
    auto packed = bigarc::pack(entries, settingsFor(kind), &error);
    ASSERT_TRUE(packed.has_value()) << error.message;

    auto archive = bigarc::Archive::fromBytes(*packed, &error);
    ASSERT_TRUE(archive.has_value()) << error.message;
    EXPECT_EQ(archive->readKind(), kind);
    EXPECT_EQ(archive->readEntryCount(), entries.size());

    auto table = archive->readEntryTable(&error);
    ASSERT_TRUE(table.has_value()) << error.message;
    EXPECT_FALSE(table->contains("some/other/key.ini"));

    for (const auto &[name, data] : entries) {
      auto bytes = archive->bytesOf(*table, name, &error);
      ASSERT_TRUE(bytes.has_value()) << name << ": " << error.message;
      EXPECT_EQ(bytes->toVector(), data) << name;
    }
  }
}

TEST_F(PackerTest, NonAsciiNamesRoundTrip) {
  std::string name = "maps/caf\xC3\xA9/\xE5\x9C\xB0\xE5\x9B\xB3.map";
  auto packed = bigarc::pack({{name, toBytes("map")}}, settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(packed.has_value());

  auto archive = bigarc::Archive::fromBytes(*packed);
  ASSERT_TRUE(archive.has_value());
  auto table = archive->readEntryTable();
  ASSERT_TRUE(table.has_value());
  EXPECT_TRUE(table->contains(name));
}

// Errors

TEST_F(PackerTest, EmptyEntrySetRejected) {
  bigarc::Error error;
  auto packed = bigarc::pack({}, settingsFor(bigarc::Kind::BigF), &error);
  EXPECT_FALSE(packed.has_value());
  EXPECT_EQ(error.code, bigarc::ErrorCode::AttemptCreateEmpty);
}

TEST_F(PackerTest, UnsupportedKindRejected) {
  bigarc::Packer packer;
  packer.addData(toBytes("x"), "x");

  bigarc::Error error;
  auto packed = packer.build(settingsFor(static_cast<bigarc::Kind>(7)), &error);
  EXPECT_FALSE(packed.has_value());
  EXPECT_EQ(error.code, bigarc::ErrorCode::UnsupportedKind);

  fs::path destPath = tempDir_ / "unsupported.big";
  EXPECT_FALSE(packer.write(destPath, settingsFor(static_cast<bigarc::Kind>(7)), &error));
  EXPECT_EQ(error.code, bigarc::ErrorCode::UnsupportedKind);
  EXPECT_FALSE(fs::exists(destPath));
}

TEST_F(PackerTest, AddMissingFile) {
  bigarc::Packer packer;
  bigarc::Error error;

  EXPECT_FALSE(packer.addFile(tempDir_ / "does_not_exist.txt", "data/file.txt", &error));
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
  EXPECT_EQ(packer.entryCount(), 0u);
}

TEST_F(PackerTest, VanishedSourceNamesEntry) {
  fs::path source = createTestFile("gone.txt", "soon gone");

  bigarc::Packer packer;
  bigarc::Error error;
  ASSERT_TRUE(packer.addFile(source, "data/gone.txt", &error)) << error.message;
  packer.addData(toBytes("stays"), "data/stays.txt");

  fs::remove(source);

  auto packed = packer.build(settingsFor(bigarc::Kind::BigF), &error);
  EXPECT_FALSE(packed.has_value());
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
  EXPECT_EQ(error.name, "data/gone.txt");
}

TEST_F(PackerTest, ShrunkSourceFails) {
  fs::path source = createTestFile("shrinks.txt", "0123456789");

  bigarc::Packer packer;
  ASSERT_TRUE(packer.addFile(source, "shrinks.txt"));
  createTestFile("shrinks.txt", "01");

  bigarc::Error error;
  EXPECT_FALSE(packer.build(settingsFor(bigarc::Kind::BigF), &error).has_value());
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
  EXPECT_EQ(error.name, "shrinks.txt");
}

TEST_F(PackerTest, FailingSourceRemovesPartialFile) {
  bigarc::Packer packer;
  packer.addData(toBytes("fine"), "a");
  packer.addSource("b", std::make_unique<BrokenSource>());

  fs::path destPath = tempDir_ / "partial.big";
  bigarc::Error error;
  EXPECT_FALSE(packer.write(destPath, settingsFor(bigarc::Kind::BigF), &error));
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
  EXPECT_EQ(error.name, "b");
  EXPECT_FALSE(fs::exists(destPath));
  EXPECT_FALSE(fs::exists(tempDir_ / "partial.big.partial"));
}

TEST_F(PackerTest, FailingSourceKeepsExistingArchive) {
  fs::path destPath = createTestFile("existing.big", "PRECIOUS");

  bigarc::Packer packer;
  packer.addData(toBytes("fine"), "a");
  packer.addSource("b", std::make_unique<BrokenSource>());

  bigarc::Error error;
  EXPECT_FALSE(packer.write(destPath, settingsFor(bigarc::Kind::BigF), &error));
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
  EXPECT_EQ(readTestFile(destPath), "PRECIOUS");
  EXPECT_FALSE(fs::exists(tempDir_ / "existing.big.partial"));
}

TEST_F(PackerTest, VanishedSourceKeepsExistingArchive) {
  fs::path destPath = createTestFile("existing.big", "PRECIOUS");
  fs::path source = createTestFile("gone.txt", "soon gone");

  bigarc::Packer packer;
  ASSERT_TRUE(packer.addFile(source, "gone.txt"));
  fs::remove(source);

  bigarc::Error error;
  EXPECT_FALSE(packer.write(destPath, settingsFor(bigarc::Kind::BigF), &error));
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
  EXPECT_EQ(error.name, "gone.txt");
  EXPECT_EQ(readTestFile(destPath), "PRECIOUS");
}

TEST_F(PackerTest, WriteReplacesExistingArchive) {
  fs::path destPath = createTestFile("existing.big", "PRECIOUS");

  bigarc::Packer packer;
  packer.addData(toBytes("new"), "new.txt");

  bigarc::Error error;
  ASSERT_TRUE(packer.write(destPath, settingsFor(bigarc::Kind::BigF), &error)) << error.message;
  EXPECT_FALSE(fs::exists(tempDir_ / "existing.big.partial"));

  auto expected = packer.build(settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(expected.has_value());
  EXPECT_EQ(readTestFile(destPath), std::string(expected->begin(), expected->end()));
}

TEST_F(PackerTest, WriteIntoMissingDirectoryLeavesNothing) {
  bigarc::Packer packer;
  packer.addData(toBytes("x"), "x");

  fs::path destPath = tempDir_ / "no_such_dir" / "out.big";
  bigarc::Error error;
  EXPECT_FALSE(packer.write(destPath, settingsFor(bigarc::Kind::BigF), &error));
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
  EXPECT_FALSE(fs::exists(tempDir_ / "no_such_dir"));
}

// Settings

TEST_F(PackerTest, SecretDataRoundTrip) {
  NamedBytes entries = {{"a.txt", toBytes("alpha")}, {"b.txt", toBytes("beta")}};

  bigarc::PackSettings plain = settingsFor(bigarc::Kind::BigF);
  bigarc::PackSettings withSecret = plain;
  withSecret.secretData = toBytes("hello");

  auto plainBytes = bigarc::pack(entries, plain);
  auto secretBytes = bigarc::pack(entries, withSecret);
  ASSERT_TRUE(plainBytes.has_value());
  ASSERT_TRUE(secretBytes.has_value());

  auto plainArchive = bigarc::Archive::fromBytes(*plainBytes);
  auto secretArchive = bigarc::Archive::fromBytes(*secretBytes);
  ASSERT_TRUE(plainArchive.has_value());
  ASSERT_TRUE(secretArchive.has_value());

  EXPECT_EQ(*secretArchive->readDataStart(), *plainArchive->readDataStart() + 5);

  auto table = secretArchive->readEntryTable();
  ASSERT_TRUE(table.has_value());
  bigarc::Error error;
  auto secret = secretArchive->readSecretData(*table, &error);
  ASSERT_TRUE(secret.has_value()) << error.message;
  EXPECT_EQ(secret->toVector(), toBytes("hello"));

  auto beta = secretArchive->bytesOf(*table, "b.txt");
  ASSERT_TRUE(beta.has_value());
  EXPECT_EQ(beta->toVector(), toBytes("beta"));

  auto plainTable = plainArchive->readEntryTable();
  ASSERT_TRUE(plainTable.has_value());
  EXPECT_FALSE(plainArchive->readSecretData(*plainTable, &error).has_value());
  EXPECT_FALSE(error);
}

TEST_F(PackerTest, EmptySecretDataAddsNoGap) {
  bigarc::PackSettings settings = settingsFor(bigarc::Kind::BigF);
  settings.secretData = Bytes{};

  auto withEmpty = bigarc::pack({{"a", toBytes("1")}}, settings);
  auto without = bigarc::pack({{"a", toBytes("1")}}, settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(withEmpty.has_value());
  ASSERT_TRUE(without.has_value());
  EXPECT_EQ(*withEmpty, *without);
}

TEST_F(PackerTest, OrderByPathIsDeterministic) {
  NamedBytes entries = {{"zeta.ini", toBytes("z")},
                        {"Alpha.ini", toBytes("A")},
                        {"alpha.ini", toBytes("a")},
                        {"dir/beta.ini", toBytes("b")}};
  NamedBytes reversed(entries.rbegin(), entries.rend());

  auto first = bigarc::pack(entries, settingsFor(bigarc::Kind::BigF));
  auto second = bigarc::pack(entries, settingsFor(bigarc::Kind::BigF));
  auto third = bigarc::pack(reversed, settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(*first, *second);
  EXPECT_EQ(*first, *third);

  auto archive = bigarc::Archive::fromBytes(*first);
  ASSERT_TRUE(archive.has_value());
  EXPECT_EQ(namesInTableOrder(*archive),
            (std::vector<std::string>{"Alpha.ini", "alpha.ini", "dir/beta.ini", "zeta.ini"}));
}

TEST_F(PackerTest, OrderBySizeIsStable) {
  NamedBytes entries = {{"three-a", Bytes(3, 0)},
                        {"one", Bytes(1, 0)},
                        {"three-b", Bytes(3, 0)},
                        {"two", Bytes(2, 0)},
                        {"none", {}}};

  auto packed =
      bigarc::pack(entries, settingsFor(bigarc::Kind::Big4, bigarc::EntryOrder::SizeAscending));
  ASSERT_TRUE(packed.has_value());

  auto archive = bigarc::Archive::fromBytes(*packed);
  ASSERT_TRUE(archive.has_value());
  EXPECT_EQ(namesInTableOrder(*archive),
            (std::vector<std::string>{"none", "one", "two", "three-a", "three-b"}));
}

TEST_F(PackerTest, StripPrefix) {
  bigarc::PackSettings settings = settingsFor(bigarc::Kind::BigF);
  settings.stripPrefix = "mod/";

  auto packed = bigarc::pack({{"mod/data/a.ini", toBytes("a")},
                              {"mod/b.ini", toBytes("b")},
                              {"other/mod/c.ini", toBytes("c")},
                              {"mod/mod/d.ini", toBytes("d")}},
                             settings);
  ASSERT_TRUE(packed.has_value());

  auto archive = bigarc::Archive::fromBytes(*packed);
  ASSERT_TRUE(archive.has_value());
  EXPECT_EQ(namesInTableOrder(*archive),
            (std::vector<std::string>{"b.ini", "data/a.ini", "mod/d.ini", "other/mod/c.ini"}));
}

TEST_F(PackerTest, DuplicateNamesDecodeLastWins) {
  auto packed = bigarc::pack({{"same.txt", toBytes("first")}, {"same.txt", toBytes("second")}},
                             settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(packed.has_value());

  auto archive = bigarc::Archive::fromBytes(*packed);
  ASSERT_TRUE(archive.has_value());
  EXPECT_EQ(archive->readEntryCount(), 2u);

  auto table = archive->readEntryTable();
  ASSERT_TRUE(table.has_value());
  EXPECT_EQ(table->size(), 1u);

  auto bytes = archive->bytesOf(*table, "same.txt");
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(bytes->toVector(), toBytes("second"));
}

// Directories and files

TEST_F(PackerTest, AddDirectory) {
  fs::path root = tempDir_ / "input";
  createTestFile("input/data/ini/weapon.ini", "Weapon");
  createTestFile("input/art/logo.tga", "TGA");
  createTestFile("input/readme.txt", "");
  fs::create_directories(root / "empty_dir");

  bigarc::Packer packer;
  bigarc::Error error;
  ASSERT_TRUE(packer.addDirectory(root, &error)) << error.message;
  EXPECT_EQ(packer.entryCount(), 3u);

  bigarc::PackSettings settings = settingsFor(bigarc::Kind::BigF);
  settings.stripPrefix = root.generic_string() + "/";

  auto archive = packer.buildArchive(settings, &error);
  ASSERT_TRUE(archive.has_value()) << error.message;
  EXPECT_EQ(namesInTableOrder(*archive),
            (std::vector<std::string>{"art/logo.tga", "data/ini/weapon.ini", "readme.txt"}));

  auto table = archive->readEntryTable();
  ASSERT_TRUE(table.has_value());
  auto weapon = archive->bytesOf(*table, "data/ini/weapon.ini");
  ASSERT_TRUE(weapon.has_value());
  EXPECT_EQ(weapon->toVector(), toBytes("Weapon"));
}

TEST_F(PackerTest, AddDirectoryKeepsTraversedPaths) {
  fs::path root = tempDir_ / "tree";
  createTestFile("tree/a.txt", "a");

  bigarc::Packer packer;
  ASSERT_TRUE(packer.addDirectory(root));

  auto layout = packer.layout(settingsFor(bigarc::Kind::BigF));
  ASSERT_TRUE(layout.has_value());
  ASSERT_EQ(layout->records.size(), 1u);
  EXPECT_EQ(layout->records[0].name, (root / "a.txt").generic_string());
}

TEST_F(PackerTest, AddDirectoryRejectsFile) {
  fs::path file = createTestFile("not_a_dir.txt", "x");

  bigarc::Packer packer;
  bigarc::Error error;
  EXPECT_FALSE(packer.addDirectory(file, &error));
  EXPECT_EQ(error.code, bigarc::ErrorCode::Io);
}

TEST_F(PackerTest, EmptyDirectoryCannotBePacked) {
  fs::create_directories(tempDir_ / "nothing");

  bigarc::Packer packer;
  bigarc::Error error;
  ASSERT_TRUE(packer.addDirectory(tempDir_ / "nothing", &error)) << error.message;

  EXPECT_FALSE(packer.build(settingsFor(bigarc::Kind::BigF), &error).has_value());
  EXPECT_EQ(error.code, bigarc::ErrorCode::AttemptCreateEmpty);
}

TEST_F(PackerTest, WriteToDisk) {
  createTestFile("file1.txt", "Hello, World!");
  createTestFile("file2.txt", "Another file");

  bigarc::Packer packer;
  bigarc::Error error;
  ASSERT_TRUE(packer.addFile(tempDir_ / "file1.txt", "mod/file1.txt", &error))
      << error.message;
  ASSERT_TRUE(packer.addFile(tempDir_ / "file2.txt", "mod/file2.txt", &error))
      << error.message;
  packer.addData(toBytes("in memory"), "mod/memory.txt");

  bigarc::PackSettings settings = settingsFor(bigarc::Kind::Big4);
  settings.secretData = toBytes("bigarc");

  fs::path archivePath = tempDir_ / "roundtrip.big";
  ASSERT_TRUE(packer.write(archivePath, settings, &error)) << error.message;

  auto inMemory = packer.build(settings, &error);
  ASSERT_TRUE(inMemory.has_value()) << error.message;
  EXPECT_EQ(fs::file_size(archivePath), inMemory->size());

  auto archive = bigarc::Archive::open(archivePath, &error);
  ASSERT_TRUE(archive.has_value()) << error.message;
  EXPECT_TRUE(std::equal(archive->data().begin(), archive->data().end(), inMemory->begin()));

  auto table = archive->readEntryTable(&error);
  ASSERT_TRUE(table.has_value()) << error.message;

  fs::path extractPath = tempDir_ / "extracted" / "file1.txt";
  ASSERT_TRUE(archive->extract(table->at("mod/file1.txt"), extractPath, &error))
      << error.message;

  std::ifstream extracted(extractPath, std::ios::binary);
  std::string content((std::istreambuf_iterator<char>(extracted)),
                      std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "Hello, World!");
}

TEST_F(PackerTest, ClearAndMove) {
  bigarc::Packer first;
  first.addData(toBytes("x"), "x");
  first.addData(toBytes("y"), "y");

  bigarc::Packer second(std::move(first));
  EXPECT_EQ(second.entryCount(), 2u);

  second.clear();
  EXPECT_EQ(second.entryCount(), 0u);

  bigarc::Error error;
  EXPECT_FALSE(second.build(settingsFor(bigarc::Kind::BigF), &error).has_value());
  EXPECT_EQ(error.code, bigarc::ErrorCode::AttemptCreateEmpty);
}
