//===-- ZipArchiveReader.cpp ----------------------------------------------===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2014 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//
//
// This file implements listing of zip archives by decoding their central
// directory. The relevant records are described in the PKWARE APPNOTE
// (sections 4.3.12 through 4.3.16).
//
//===----------------------------------------------------------------------===//

#include "jvmdeps/Archive/ArchiveReader.h"
#include "jvmdeps/Archive/AttributionError.h"

#include "jvmdeps/Basic/BinaryCoding.h"
#include "jvmdeps/Basic/FileSystem.h"

#include "llvm/Support/MemoryBuffer.h"

#include <algorithm>

using namespace jvmdeps;
using namespace jvmdeps::archive;
using namespace jvmdeps::basic;

namespace {

enum : uint32_t {
  CentralDirectoryHeaderSignature = 0x02014b50,
  EndOfCentralDirectorySignature = 0x06054b50,
  Zip64EndOfCentralDirectorySignature = 0x06064b50,
  Zip64EndOfCentralDirectoryLocatorSignature = 0x07064b50,
};

enum : uint64_t {
  EndOfCentralDirectorySize = 22,
  Zip64EndOfCentralDirectoryLocatorSize = 20,
  CentralDirectoryHeaderSize = 46,
  MaxCommentSize = 0xFFFF,
};

/// The location of the central directory, as recorded by the end records.
struct CentralDirectoryLocation {
  uint64_t numEntries = 0;
  uint64_t size = 0;
  uint64_t offset = 0;
};

class ZipArchiveReader : public ArchiveReader {
  FileSystem& fs;

  llvm::Error corrupt(StringRef path, const Twine& reason) {
    return llvm::make_error<AttributionError>(
        path, "corrupt archive (" + reason + ")");
  }

  /// Find the offset of the end of central directory record, which is the last
  /// record in the file, followed only by the archive comment.
  bool findEndOfCentralDirectory(BinaryDecoder& decoder, uint64_t& offset) {
    if (decoder.size() < EndOfCentralDirectorySize)
      return false;

    uint64_t last = decoder.size() - EndOfCentralDirectorySize;
    uint64_t first = last > MaxCommentSize ? last - MaxCommentSize : 0;
    for (uint64_t candidate = last + 1; candidate-- > first; ) {
      uint32_t signature;
      if (!decoder.seek(candidate) || !decoder.read(signature))
        return false;
      if (signature == EndOfCentralDirectorySignature) {
        offset = candidate;
        return true;
      }
    }
    return false;
  }

  /// Read the Zip64 end of central directory record, if the archive has one.
  llvm::Error readZip64Location(StringRef path, BinaryDecoder& decoder,
                                uint64_t endOffset,
                                CentralDirectoryLocation& location) {
    if (endOffset < Zip64EndOfCentralDirectoryLocatorSize)
      return llvm::Error::success();

    uint32_t signature, disk, numDisks;
    uint64_t recordOffset;
    decoder.seek(endOffset - Zip64EndOfCentralDirectoryLocatorSize);
    if (!decoder.read(signature) ||
        signature != Zip64EndOfCentralDirectoryLocatorSignature) {
      // Not a Zip64 archive, the saturated fields are genuine.
      return llvm::Error::success();
    }
    if (!decoder.read(disk) || !decoder.read(recordOffset) ||
        !decoder.read(numDisks))
      return corrupt(path, "truncated zip64 locator");

    uint64_t recordSize, entriesOnDisk;
    uint16_t versionMadeBy, versionNeeded;
    uint32_t diskNumber, directoryDisk;
    if (!decoder.seek(recordOffset) || !decoder.read(signature))
      return corrupt(path, "invalid zip64 end of central directory offset");
    if (signature != Zip64EndOfCentralDirectorySignature)
      return corrupt(path, "invalid zip64 end of central directory signature");
    if (!decoder.read(recordSize) || !decoder.read(versionMadeBy) ||
        !decoder.read(versionNeeded) || !decoder.read(diskNumber) ||
        !decoder.read(directoryDisk) || !decoder.read(entriesOnDisk) ||
        !decoder.read(location.numEntries) || !decoder.read(location.size) ||
        !decoder.read(location.offset))
      return corrupt(path, "truncated zip64 end of central directory");

    return llvm::Error::success();
  }

  llvm::Error readLocation(StringRef path, BinaryDecoder& decoder,
                           CentralDirectoryLocation& location) {
    uint64_t endOffset;
    if (!findEndOfCentralDirectory(decoder, endOffset))
      return corrupt(path, "missing end of central directory record");

    uint32_t signature, size, offset;
    uint16_t disk, directoryDisk, entriesOnDisk, numEntries;
    decoder.seek(endOffset);
    if (!decoder.read(signature) || !decoder.read(disk) ||
        !decoder.read(directoryDisk) || !decoder.read(entriesOnDisk) ||
        !decoder.read(numEntries) || !decoder.read(size) ||
        !decoder.read(offset))
      return corrupt(path, "truncated end of central directory record");

    location.numEntries = numEntries;
    location.size = size;
    location.offset = offset;

    // Saturated fields defer to the Zip64 record.
    if (numEntries == 0xFFFF || size == 0xFFFFFFFF || offset == 0xFFFFFFFF) {
      if (auto err = readZip64Location(path, decoder, endOffset, location))
        return err;
    }

    if (location.offset > decoder.size() ||
        location.size > decoder.size() - location.offset)
      return corrupt(path, "central directory out of bounds");

    return llvm::Error::success();
  }

public:
  explicit ZipArchiveReader(FileSystem& fs) : fs(fs) {}

  virtual llvm::Expected<std::vector<std::string>>
  listEntries(const std::string& path) override {
    auto buffer = fs.getFileContents(path);
    if (!buffer) {
      return llvm::make_error<AttributionError>(path,
                                                "unable to read archive");
    }

    BinaryDecoder decoder(buffer->getBuffer());
    CentralDirectoryLocation location;
    if (auto err = readLocation(path, decoder, location))
      return std::move(err);

    // Each entry occupies at least a fixed-size header, which bounds the number
    // of entries that can legitimately be recorded.
    if (location.numEntries > location.size / CentralDirectoryHeaderSize)
      return corrupt(path, "too many central directory entries");

    std::vector<std::string> result;
    result.reserve(location.numEntries);
    decoder.seek(location.offset);
    for (uint64_t i = 0; i != location.numEntries; ++i) {
      uint32_t signature;
      if (!decoder.read(signature))
        return corrupt(path, "truncated central directory");
      if (signature != CentralDirectoryHeaderSignature)
        return corrupt(path, "invalid central directory entry signature");

      // Skip the version, flag, method, time, date, CRC and size fields.
      uint16_t nameLength, extraLength, commentLength;
      if (!decoder.skip(24) || !decoder.read(nameLength) ||
          !decoder.read(extraLength) || !decoder.read(commentLength))
        return corrupt(path, "truncated central directory");

      // Skip the disk, attribute and local header offset fields.
      StringRef name;
      if (!decoder.skip(12) || !decoder.readBytes(nameLength, name) ||
          !decoder.skip(uint64_t(extraLength) + commentLength))
        return corrupt(path, "truncated central directory entry");

      result.push_back(name.str());
    }

    return std::move(result);
  }
};

}

std::unique_ptr<ArchiveReader> archive::createZipArchiveReader(FileSystem& fs) {
  return std::make_unique<ZipArchiveReader>(fs);
}
