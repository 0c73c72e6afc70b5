#include "model/position_ids.h"

namespace roberta {

torch::Tensor position_ids_from_token_ids(const torch::Tensor& ids, int64_t padding_idx) {
  torch::Tensor mask = ids.ne(padding_idx).to(torch::kLong);
  return mask.cumsum(1, torch::kLong) * mask + padding_idx;
}

torch::Tensor position_ids_from_token_vectors(const torch::Tensor& vectors, int64_t padding_idx) {
  const int64_t batch = vectors.size(0);
  const int64_t seq_len = vectors.size(1);
  auto opts = torch::TensorOptions().dtype(torch::kLong).device(vectors.device());
  torch::Tensor pos = torch::arange(padding_idx + 1, padding_idx + 1 + seq_len, opts);
  return pos.unsqueeze(0).expand({batch, seq_len});
}

} // namespace roberta
