/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fcntl.h>
#include <string>

namespace mk::primitives::piece {

  const int kUnopenedFileDescriptor = -1;

  /**
   * Owns descriptor of file or pipe with piece bytes.
   * Null data stands for zero-filled piece and has no descriptor.
   */
  class PieceData {
   public:
    explicit PieceData(const std::string &path_to_file, int flags = O_RDONLY);
    explicit PieceData(int &pipe_fd);  // pipe_fd is out parameter and is
                                       // expected to be set -1 after call.

    PieceData(const PieceData &) = delete;
    PieceData &operator=(const PieceData &) = delete;
    PieceData(PieceData &&other) noexcept;
    PieceData &operator=(PieceData &&other) noexcept;

    ~PieceData();

    int getFd() const;

    bool isOpened() const;

    [[nodiscard]] int release();

    bool isNullData() const;

    static PieceData makeNull();

   private:
    PieceData() = default;

    void close();

    int fd_{kUnopenedFileDescriptor};
    bool is_null_data_{false};
  };

}  // namespace mk::primitives::piece
