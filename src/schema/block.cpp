#include <explorer/schema/block.hpp>

namespace explorer::schema {

block_t make_block(const applied_block_t& applied,
                   const chain_length_t chain_length) {
  auto out = block_t{};
  out.id = applied.id;
  out.parent_id = applied.parent_id;
  out.date = applied.date;
  out.chain_length = chain_length;
  out.score = applied.score;
  out.leader = applied.leader;
  out.treasury = applied.treasury;
  out.transactions.reserve(applied.transactions.size());
  for (const auto& transaction : applied.transactions) {
    out.transactions.push_back(transaction.id);
    for (const auto& input : transaction.inputs) {
      out.total_input += input.value;
    }
    for (const auto& output : transaction.outputs) {
      out.total_output += output.value;
    }
  }
  return out;
}

}  // namespace explorer::schema
