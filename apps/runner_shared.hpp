#pragma once

#include "arm_angle/pipeline/orchestrator.hpp"
#include "arm_angle/store/unit_store.hpp"

#include <ostream>
#include <streambuf>
#include <string>
#include <vector>

namespace arm_angle::runner {

// Writes every character to both buffers; either may be null.
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

// Per-stage counts followed by the failure list.
void print_run_report(const pipeline::RunReport &report, std::ostream &out);

void print_status_table(const store::UnitStore &store,
                        const std::vector<store::Unit> &units,
                        std::ostream &out);

// Asks once on the terminal; anything but y/yes declines.
bool confirm_deletion(std::istream &in, std::ostream &out);

} // namespace arm_angle::runner
