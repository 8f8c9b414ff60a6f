#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <random>

#include "internal/core/store.hpp"

namespace chronicle::maintenance {

/*
  Sample data for demos and manual testing. Output is reproducible for a
  given seed; ids are random UUIDs.
*/
class DataSeeder {
 public:
  explicit DataSeeder(std::shared_ptr<core::Store> store, uint32_t seed = std::random_device{}());

  // Each returns the number of records written.
  std::size_t SeedUsers(std::size_t count = 10);
  std::size_t SeedProducts(std::size_t count = 20);
  std::size_t SeedBankAccounts(std::size_t count = 5);

  void SeedAll();

 private:
  int Uniform(int lo, int hi);

  std::shared_ptr<core::Store> store_;
  std::mt19937                 rng_;
};

} // namespace chronicle::maintenance
