#include "proof_hash.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "internal/ledger/canonical_json.hpp"

namespace settle::ledger {

namespace {

struct EvpMdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

} // namespace

ProofFields FieldsOf(const model::SettlementLine& line) {
  return ProofFields{line.batch_id, line.participant_id, line.amount, line.description};
}

std::string CanonicalLinePayload(const ProofFields& fields) {
  const nlohmann::json payload = {
      {"amount_eur", model::ToEur(fields.amount)},
      {"batch_id", fields.batch_id},
      {"description", fields.description},
      {"participant_id", fields.participant_id},
  };
  return Canonicalize(payload);
}

std::string ComputeProofHash(const ProofFields& fields) {
  return Sha256Hex(CanonicalLinePayload(fields));
}

bool VerifyProofHash(const ProofFields& fields, std::string_view stored_hash) {
  return ComputeProofHash(fields) == stored_hash;
}

std::string Sha256Hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }

  unsigned char out[EVP_MAX_MD_SIZE];
  unsigned int  out_len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           hex;
  hex.reserve(out_len * 2);
  for (unsigned int i = 0; i < out_len; ++i) {
    hex.push_back(kHex[(out[i] >> 4) & 0x0F]);
    hex.push_back(kHex[out[i] & 0x0F]);
  }
  return hex;
}

std::string DescribeLine(std::string_view use_case, model::Cents amount) {
  if (amount >= 0) {
    return fmt::format("{} settlement: pays {} EUR", use_case, model::FormatEur(amount));
  }
  return fmt::format("{} settlement: receives {} EUR", use_case, model::FormatEur(-amount));
}

} // namespace settle::ledger
