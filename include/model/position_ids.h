#pragma once

#include <torch/torch.h>

#include "core/config.h"

namespace roberta {

// ids: [B, T] int64
// returns: [B, T] int64
//
// Non-padding tokens are numbered padding_idx + 1, padding_idx + 2, ... in
// order of appearance along T; every padding token gets padding_idx itself.
// Counting resumes after interior padding instead of restarting.
torch::Tensor position_ids_from_token_ids(const torch::Tensor& ids,
                                          int64_t padding_idx = kPaddingIdx);

// vectors: [B, T, H]
// returns: [B, T] int64, every row equal to padding_idx + 1 .. padding_idx + T
//
// Precomputed vectors carry no token ids, so padding cannot be detected here.
torch::Tensor position_ids_from_token_vectors(const torch::Tensor& vectors,
                                              int64_t padding_idx = kPaddingIdx);

} // namespace roberta
