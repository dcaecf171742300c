#include "runner_shared.hpp"

#include "arm_angle/core/utils.hpp"

#include <algorithm>
#include <iomanip>
#include <istream>

namespace arm_angle::runner {

namespace core = arm_angle::core;

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

void print_run_report(const pipeline::RunReport &report, std::ostream &out) {
  out << "\nRun " << report.run_id << (report.dry_run ? " (dry run)" : "")
      << ": " << report.units_discovered << " unit(s)\n\n";

  out << std::left << std::setw(9) << "stage" << std::right << std::setw(10)
      << "processed" << std::setw(9) << "skipped" << std::setw(8) << "failed"
      << std::setw(11) << "timed out" << std::setw(9) << "deleted"
      << std::setw(15) << "delete failed";
  if (report.dry_run)
    out << std::setw(9) << "pending";
  out << "\n";

  for (const auto &s : report.stages) {
    out << std::left << std::setw(9) << stage_to_string(s.stage) << std::right;
    if (!s.active) {
      out << std::setw(10) << "-" << "  (not run)\n";
      continue;
    }
    out << std::setw(10) << s.processed << std::setw(9) << s.skipped
        << std::setw(8) << s.failed << std::setw(11) << s.timed_out
        << std::setw(9) << s.deleted << std::setw(15) << s.delete_failed;
    if (report.dry_run)
      out << std::setw(9) << s.pending;
    out << "\n";
  }

  if (report.exported.written) {
    out << "\nResults: " << report.exported.results_csv.string() << " ("
        << report.exported.rows << " row(s), "
        << report.exported.units_with_ground_truth << " unit(s) with ground truth, "
        << report.exported.units_without_ground_truth << " without)\n";
    out << "Summary: " << report.exported.summary_csv.string() << ", "
        << report.exported.summary_json.string() << "\n";
    for (const auto &p : report.exported.plots) {
      out << "Plot:    " << p.string() << "\n";
    }
  }

  if (!report.failures.empty()) {
    out << "\nFailures:\n";
    for (const auto &f : report.failures) {
      out << "  [" << stage_to_string(f.stage) << "] " << f.unit_id << " "
          << f.kind << ": " << f.reason << "\n";
    }
  }
  out.flush();
}

void print_status_table(const store::UnitStore &store,
                        const std::vector<store::Unit> &units,
                        std::ostream &out) {
  size_t id_width = 4;
  for (const auto &u : units)
    id_width = std::max(id_width, u.id.size());

  out << std::left << std::setw(static_cast<int>(id_width) + 2) << "unit"
      << std::setw(26) << "state" << std::setw(9) << "extract" << std::setw(7)
      << "label" << "measure\n";
  for (const auto &u : units) {
    const store::UnitStatus st = store.status(u);
    auto mark = [](bool done) { return done ? "done" : "-"; };
    out << std::left << std::setw(static_cast<int>(id_width) + 2) << u.id
        << std::setw(26) << store::describe_status(st) << std::setw(9)
        << mark(st.extract_complete) << std::setw(7) << mark(st.label_complete)
        << mark(st.measure_complete) << "\n";
  }
  out << "\n" << units.size() << " unit(s)" << std::endl;
}

bool confirm_deletion(std::istream &in, std::ostream &out) {
  out << "Raw videos will be deleted after their frames are extracted. "
         "Continue? [y/N] "
      << std::flush;
  std::string answer;
  if (!std::getline(in, answer))
    return false;
  answer = core::to_lower(core::trim(answer));
  return answer == "y" || answer == "yes";
}

} // namespace arm_angle::runner
