//===- ZipWriter.cpp ------------------------------------------------------===//
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

#include "ZipWriter.h"

#include "TempDir.h"

#include "jvmdeps/Basic/BinaryCoding.h"

#include "llvm/Support/CRC.h"

using namespace jvmdeps;
using namespace jvmdeps::basic;

std::vector<uint8_t>
jvmdeps::createZipArchive(llvm::ArrayRef<std::string> entries,
                          const ZipOptions& options) {
  BinaryEncoder encoder;
  std::vector<uint32_t> offsets;
  std::vector<uint32_t> checksums;

  // Local file headers and data.
  for (const auto& name: entries) {
    llvm::ArrayRef<uint8_t> data(
        reinterpret_cast<const uint8_t*>(name.data()), name.size());
    offsets.push_back(uint32_t(encoder.size()));
    checksums.push_back(llvm::crc32(data));

    encoder.write(uint32_t(0x04034b50));
    encoder.write(uint16_t(20)); // version needed
    encoder.write(uint16_t(0));  // flags
    encoder.write(uint16_t(0));  // method (stored)
    encoder.write(uint16_t(0));  // time
    encoder.write(uint16_t(0));  // date
    encoder.write(checksums.back());
    encoder.write(uint32_t(name.size()));
    encoder.write(uint32_t(name.size()));
    encoder.write(uint16_t(name.size()));
    encoder.write(uint16_t(0));  // extra length
    encoder.writeBytes(name);
    encoder.writeBytes(name);
  }

  // Central directory.
  uint64_t directoryOffset = encoder.size();
  for (unsigned i = 0; i != entries.size(); ++i) {
    const auto& name = entries[i];
    encoder.write(uint32_t(0x02014b50));
    encoder.write(uint16_t(20)); // version made by
    encoder.write(uint16_t(20)); // version needed
    encoder.write(uint16_t(0));  // flags
    encoder.write(uint16_t(0));  // method
    encoder.write(uint16_t(0));  // time
    encoder.write(uint16_t(0));  // date
    encoder.write(checksums[i]);
    encoder.write(uint32_t(name.size()));
    encoder.write(uint32_t(name.size()));
    encoder.write(uint16_t(name.size()));
    encoder.write(uint16_t(0));  // extra length
    encoder.write(uint16_t(0));  // comment length
    encoder.write(uint16_t(0));  // disk number
    encoder.write(uint16_t(0));  // internal attributes
    encoder.write(uint32_t(0));  // external attributes
    encoder.write(offsets[i]);
    encoder.writeBytes(name);
  }
  uint64_t directorySize = encoder.size() - directoryOffset;

  if (options.zip64) {
    uint64_t recordOffset = encoder.size();
    encoder.write(uint32_t(0x06064b50));
    encoder.write(uint64_t(44)); // size of the remaining record
    encoder.write(uint16_t(45));
    encoder.write(uint16_t(45));
    encoder.write(uint32_t(0));
    encoder.write(uint32_t(0));
    encoder.write(uint64_t(entries.size()));
    encoder.write(uint64_t(entries.size()));
    encoder.write(directorySize);
    encoder.write(directoryOffset);

    encoder.write(uint32_t(0x07064b50));
    encoder.write(uint32_t(0));
    encoder.write(recordOffset);
    encoder.write(uint32_t(1));
  }

  encoder.write(uint32_t(0x06054b50));
  encoder.write(uint16_t(0));
  encoder.write(uint16_t(0));
  if (options.zip64) {
    encoder.write(uint16_t(0xFFFF));
    encoder.write(uint16_t(0xFFFF));
    encoder.write(uint32_t(0xFFFFFFFF));
    encoder.write(uint32_t(0xFFFFFFFF));
  } else {
    encoder.write(uint16_t(entries.size()));
    encoder.write(uint16_t(entries.size()));
    encoder.write(uint32_t(directorySize));
    encoder.write(uint32_t(directoryOffset));
  }
  encoder.write(uint16_t(options.comment.size()));
  encoder.writeBytes(options.comment);

  return encoder.contents();
}

bool jvmdeps::writeZipArchive(llvm::StringRef path,
                              llvm::ArrayRef<std::string> entries,
                              const ZipOptions& options) {
  auto data = createZipArchive(entries, options);
  return writeFile(path, llvm::StringRef(
                       reinterpret_cast<const char*>(data.data()),
                       data.size()));
}
