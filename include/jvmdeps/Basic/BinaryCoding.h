//===- BinaryCoding.h -------------------------------------------*- C++ -*-===//
//
// This source file is part of the Swift.org open source project
//
// Copyright (c) 2017 - 2026 Apple Inc. and the Swift project authors
// Licensed under Apache License v2.0 with Runtime Library Exception
//
// See http://swift.org/LICENSE.txt for license information
// See http://swift.org/CONTRIBUTORS.txt for the list of Swift project authors
//
//===----------------------------------------------------------------------===//

#ifndef JVMDEPS_BASIC_BINARYCODING_H
#define JVMDEPS_BASIC_BINARYCODING_H

#include "jvmdeps/Basic/Compiler.h"
#include "jvmdeps/Basic/LLVM.h"

#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>
#include <vector>

namespace jvmdeps {
namespace basic {

/// A little-endian binary encoding utility.
///
/// The layout matches the one used by on-disk archive structures (all
/// multi-byte integers are little-endian), and should be paired with \see
/// BinaryDecoder for decoding.
class BinaryEncoder {
private:
   // Copying is disabled.
   BinaryEncoder(const BinaryEncoder&) JVMDEPS_DELETED_FUNCTION;
   void operator=(const BinaryEncoder&) JVMDEPS_DELETED_FUNCTION;

  /// The encoded data.
  llvm::SmallVector<uint8_t, 256> data;

public:
  /// Construct a new binary encoder.
  BinaryEncoder() {}

  /// The number of bytes encoded so far.
  uint64_t size() const { return data.size(); }

  /// Encode a value to the stream.
  void write(uint8_t value) {
    data.push_back(value);
  }

  /// Encode a value to the stream.
  void write(uint16_t value) {
    write(uint8_t(value >> 0));
    write(uint8_t(value >> 8));
  }

  /// Encode a value to the stream.
  void write(uint32_t value) {
    write(uint16_t(value >> 0));
    write(uint16_t(value >> 16));
  }

  /// Encode a value to the stream.
  void write(uint64_t value) {
    write(uint32_t(value >> 0));
    write(uint32_t(value >> 32));
  }

  /// Encode a sequence of bytes to the stream.
  void writeBytes(StringRef bytes) {
    data.insert(data.end(), bytes.begin(), bytes.end());
  }

  /// Get the encoded binary data.
  std::vector<uint8_t> contents() const {
    return std::vector<uint8_t>(data.begin(), data.end());
  }
};

/// A little-endian binary decoding utility.
///
/// Unlike the encoder, the decoder operates on untrusted input: every read is
/// bounds checked and reports failure rather than reading past the end of the
/// data. A failed read leaves the position unchanged.
///
/// \see BinaryEncoder.
class BinaryDecoder {
private:
   // Copying is disabled.
   BinaryDecoder(const BinaryDecoder&) JVMDEPS_DELETED_FUNCTION;
   void operator=(const BinaryDecoder&) JVMDEPS_DELETED_FUNCTION;

  /// The data being decoded.
  StringRef data;

  /// The current position in the stream.
  uint64_t pos = 0;

  uint8_t read8() { return uint8_t(data[pos++]); }
  uint16_t read16() {
    uint16_t result = read8();
    result |= uint16_t(read8()) << 8;
    return result;
  }
  uint32_t read32() {
    uint32_t result = read16();
    result |= uint32_t(read16()) << 16;
    return result;
  }
  uint64_t read64() {
    uint64_t result = read32();
    result |= uint64_t(read32()) << 32;
    return result;
  }

public:
  /// Construct a binary decoder.
  ///
  /// NOTE: The input data is supplied by reference, and its lifetime must
  /// exceed that of the decoder.
  explicit BinaryDecoder(StringRef data) : data(data) {}

  /// Construct a binary decoder.
  explicit BinaryDecoder(const std::vector<uint8_t>& data) : BinaryDecoder(
      StringRef(reinterpret_cast<const char*>(data.data()), data.size())) {}

  /// The total size of the decoded data.
  uint64_t size() const { return data.size(); }

  /// The current position in the stream.
  uint64_t getPosition() const { return pos; }

  /// Check if the decoder is at the end of the stream.
  bool isEmpty() const {
    return pos == data.size();
  }

  /// Check if \arg count more bytes are available.
  bool canRead(uint64_t count) const {
    return count <= data.size() - pos;
  }

  /// Move to an absolute position in the stream.
  ///
  /// \returns False if the position is past the end of the data.
  bool seek(uint64_t position) {
    if (position > data.size())
      return false;
    pos = position;
    return true;
  }

  /// Skip over \arg count bytes.
  bool skip(uint64_t count) {
    if (!canRead(count))
      return false;
    pos += count;
    return true;
  }

  /// Decode a value from the stream.
  bool read(uint8_t& value) {
    if (!canRead(1)) return false;
    value = read8();
    return true;
  }

  /// Decode a value from the stream.
  bool read(uint16_t& value) {
    if (!canRead(2)) return false;
    value = read16();
    return true;
  }

  /// Decode a value from the stream.
  bool read(uint32_t& value) {
    if (!canRead(4)) return false;
    value = read32();
    return true;
  }

  /// Decode a value from the stream.
  bool read(uint64_t& value) {
    if (!canRead(8)) return false;
    value = read64();
    return true;
  }

  /// Decode a byte string from the stream.
  ///
  /// NOTE: The return value points into the decode stream, and must be copied
  /// by clients if it is to last longer than the lifetime of the decoder.
  bool readBytes(uint64_t count, StringRef& value) {
    if (!canRead(count))
      return false;
    value = data.substr(pos, count);
    pos += count;
    return true;
  }
};

}
}

#endif
