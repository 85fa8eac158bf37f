/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/piece/piece_data.hpp"

#include <unistd.h>

namespace mk::primitives::piece {
  PieceData::PieceData(const std::string &path_to_file, int flags)
      : fd_{open(path_to_file.c_str(), flags, 0644)} {}

  PieceData::PieceData(int &pipe_fd) : fd_(pipe_fd) {
    pipe_fd = kUnopenedFileDescriptor;
  }

  PieceData::PieceData(PieceData &&other) noexcept
      : fd_(other.fd_), is_null_data_(other.is_null_data_) {
    other.fd_ = kUnopenedFileDescriptor;
    other.is_null_data_ = false;
  }

  PieceData &PieceData::operator=(PieceData &&other) noexcept {
    if (this != &other) {
      close();
      fd_ = other.fd_;
      is_null_data_ = other.is_null_data_;

      other.fd_ = kUnopenedFileDescriptor;
      other.is_null_data_ = false;
    }
    return *this;
  }

  PieceData::~PieceData() {
    close();
  }

  void PieceData::close() {
    if (fd_ != kUnopenedFileDescriptor) {
      ::close(fd_);
      fd_ = kUnopenedFileDescriptor;
    }
  }

  int PieceData::getFd() const {
    return fd_;
  }

  bool PieceData::isOpened() const {
    return fd_ != kUnopenedFileDescriptor;
  }

  bool PieceData::isNullData() const {
    return is_null_data_;
  }

  PieceData PieceData::makeNull() {
    PieceData temp;
    temp.is_null_data_ = true;
    return temp;
  }

  int PieceData::release() {
    const int temp = fd_;
    fd_ = kUnopenedFileDescriptor;
    return temp;
  }

}  // namespace mk::primitives::piece
