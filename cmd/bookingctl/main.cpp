#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/tracing.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

using booking::model::AvailableSlot;
using booking::model::TimeInterval;
using booking::util::FormatTimestamp;
using booking::util::ParseTimestamp;

static void Usage() {
  std::cout << "Usage:\n"
            << "  bookingctl [--config <config.yaml>] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  search <start> <end> [--duration M] [--resource R]... [--max N] [--buffer M] [--step M] [--location L]\n"
            << "  free <start> <duration> [--resource R] [--exclude ID]\n"
            << "  conflicts <start> <duration> [--resource R] [--exclude ID]\n"
            << "  validate <start> <duration> [--resource R]\n"
            << "  suggest <start> [--duration M] [--resource R] [--within D] [--max N] [--buffer]\n"
            << "  next <from> [--duration M] [--resource R]... [--days N]\n"
            << "  day <YYYY-MM-DD> [--duration M] [--resource R]...\n"
            << "  book <start> <duration> [--resource R] [--note TEXT]\n"
            << "  reschedule <booking_id> <start> <duration>\n"
            << "  cancel <booking_id>\n"
            << "  resources\n"
            << "  hours\n"
            << "\n"
            << "Timestamps are YYYY-MM-DDTHH:MM[:SS][Z|+HH:MM]; durations are minutes.\n";
}

namespace {

/*
  Positional arguments plus "--flag value" pairs. Repeated flags keep every
  value; bare flags ("--buffer") map to an empty value.
*/
struct Args {
  std::vector<std::string>                        positional;
  std::map<std::string, std::vector<std::string>> flags;

  std::optional<std::string> Flag(const std::string& name) const {
    auto it = flags.find(name);
    if (it == flags.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  std::optional<int> IntFlag(const std::string& name) const {
    auto value = Flag(name);
    if (!value) return std::nullopt;
    return ParseInt(*value, name);
  }

  std::optional<std::vector<std::string>> ListFlag(const std::string& name) const {
    auto it = flags.find(name);
    if (it == flags.end()) return std::nullopt;
    return it->second;
  }

  bool Has(const std::string& name) const {
    return flags.count(name) != 0;
  }

  const std::string& At(std::size_t index, const char* what) const {
    if (index >= positional.size()) {
      throw booking::util::InvalidArgument(std::string("missing argument: ") + what);
    }
    return positional[index];
  }

  static int ParseInt(const std::string& text, const std::string& what) {
    std::size_t consumed = 0;
    int         value    = 0;
    try {
      value = std::stoi(text, &consumed);
    } catch (const std::logic_error&) {
      consumed = 0;
    }
    if (consumed != text.size() || text.empty()) {
      throw booking::util::InvalidArgument(what + " must be an integer, got '" + text + "'");
    }
    return value;
  }
};

const std::vector<std::string> kBareFlags = {"--buffer"};

Args ParseArgs(int argc, char** argv, int first) {
  Args args;
  for (int i = first; i < argc; ++i) {
    const std::string token = argv[i];
    if (token.rfind("--", 0) != 0) {
      args.positional.push_back(token);
      continue;
    }
    const std::string name = token.substr(2);
    if (std::find(kBareFlags.begin(), kBareFlags.end(), token) != kBareFlags.end()) {
      args.flags[name];
      continue;
    }
    if (i + 1 >= argc) {
      throw booking::util::InvalidArgument("flag " + token + " needs a value");
    }
    args.flags[name].push_back(argv[++i]);
  }
  return args;
}

TimeInterval IntervalFrom(const Args& args, std::size_t start_index) {
  const auto start    = ParseTimestamp(args.At(start_index, "start"));
  const auto duration = Args::ParseInt(args.At(start_index + 1, "duration"), "duration");
  return TimeInterval{start, start + std::chrono::minutes(duration)};
}

std::string Join(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += ",";
    out += item;
  }
  return out;
}

void PrintSlot(const AvailableSlot& slot) {
  std::cout << FormatTimestamp(slot.interval.start) << "  " << FormatTimestamp(slot.interval.end) << "  " << Join(slot.eligible_resource_ids);
  if (slot.location_id) std::cout << "  @" << *slot.location_id;
  std::cout << "\n";
}

int RunCommand(const std::string& cmd, const Args& args, booking::factory::Application& app) {
  auto& coordinator = *app.coordinator;

  if (cmd == "search") {
    booking::model::AvailabilitySearchRequest request;
    request.range_start      = ParseTimestamp(args.At(0, "start"));
    request.range_end        = ParseTimestamp(args.At(1, "end"));
    request.resource_ids     = args.ListFlag("resource");
    request.duration_minutes = args.IntFlag("duration");
    request.max_results      = args.IntFlag("max");
    request.buffer_minutes   = args.IntFlag("buffer");
    request.step_minutes     = args.IntFlag("step");
    request.location_id      = args.Flag("location");
    for (const auto& slot : coordinator.Search(request)) PrintSlot(slot);
    return 0;
  }

  if (cmd == "free") {
    const bool free = coordinator.IsSlotFree(IntervalFrom(args, 0), args.Flag("resource"), args.Flag("exclude"));
    std::cout << (free ? "free" : "busy") << "\n";
    return free ? 0 : 3;
  }

  if (cmd == "conflicts") {
    const auto report = coordinator.DetectConflicts(IntervalFrom(args, 0), args.Flag("resource"), args.Flag("exclude"));
    for (const auto& entry : report.conflicts) {
      std::cout << entry.booking.id << "  " << booking::model::ToString(entry.booking.interval) << "  overlap "
                << booking::model::ToString(entry.overlap) << "  " << entry.booking.resource_id.value_or("-") << "\n";
    }
    return report.empty() ? 0 : 3;
  }

  if (cmd == "validate") {
    const auto start    = ParseTimestamp(args.At(0, "start"));
    const auto duration = Args::ParseInt(args.At(1, "duration"), "duration");
    const auto result   = coordinator.ValidateSchedulingRules(start, duration, args.Flag("resource"));
    if (result.valid) {
      std::cout << "valid\n";
      return 0;
    }
    for (const auto& code : result.ReasonCodes()) std::cout << code << "\n";
    return 3;
  }

  if (cmd == "suggest") {
    booking::model::AlternativeOptions alternatives;
    alternatives.within_days     = args.IntFlag("within");
    alternatives.max_suggestions = args.IntFlag("max");
    alternatives.include_buffer  = args.Has("buffer");
    const auto suggestions =
        coordinator.SuggestAlternatives(ParseTimestamp(args.At(0, "start")), args.IntFlag("duration"), args.Flag("resource"), alternatives);
    for (const auto& suggestion : suggestions) {
      std::cout << "#" << suggestion.rank << " (" << suggestion.distance.count() << "m)  ";
      PrintSlot(suggestion.slot);
    }
    return 0;
  }

  if (cmd == "next") {
    const auto next = coordinator.FindNextAvailable(ParseTimestamp(args.At(0, "from")), args.IntFlag("duration"), args.ListFlag("resource"),
                                                    args.IntFlag("days"));
    if (!next) {
      std::cout << "none\n";
      return 3;
    }
    PrintSlot(next->slot);
    return 0;
  }

  if (cmd == "day") {
    const auto day = booking::util::ParseDate(args.At(0, "date"));
    for (const auto& [resource_id, slots] : coordinator.ResourceAvailability(day, args.ListFlag("resource"), args.IntFlag("duration"))) {
      std::cout << resource_id << ": " << slots.size() << " slot(s)\n";
      for (const auto& slot : slots) {
        std::cout << "  ";
        PrintSlot(slot);
      }
    }
    return 0;
  }

  if (cmd == "book") {
    const auto id = app.store->CreateBooking(IntervalFrom(args, 0), args.Flag("resource"), args.Flag("note").value_or(""));
    std::cout << id << "\n";
    return 0;
  }

  if (cmd == "reschedule") {
    app.store->UpdateBookingTime(args.At(0, "booking_id"), IntervalFrom(args, 1));
    std::cout << "ok\n";
    return 0;
  }

  if (cmd == "cancel") {
    app.store->CancelBooking(args.At(0, "booking_id"));
    std::cout << "ok\n";
    return 0;
  }

  if (cmd == "resources") {
    for (const auto& resource : app.store->ListResources(std::nullopt)) {
      std::cout << resource.id << "  " << resource.display_name << "\n";
    }
    return 0;
  }

  if (cmd == "hours") {
    const auto snapshot = app.catalog->Snapshot();
    std::cout << "utc_offset_minutes " << snapshot->utc_offset().count() << "\n";
    for (const auto& rule : snapshot->Rules()) {
      std::cout << rule.day_of_week << "  ";
      if (!rule.is_open) {
        std::cout << "closed\n";
        continue;
      }
      std::cout << booking::hours::FormatTimeOfDay(rule.open_time) << "-" << booking::hours::FormatTimeOfDay(rule.close_time);
      for (const auto& brk : rule.breaks) {
        std::cout << "  break " << booking::hours::FormatTimeOfDay(brk.start) << "-" << booking::hours::FormatTimeOfDay(brk.end);
      }
      std::cout << "\n";
    }
    for (const auto& special : snapshot->SpecialDays()) {
      std::cout << booking::util::FormatDate(special.date) << "  ";
      if (special.is_closed) {
        std::cout << "closed";
      } else {
        std::cout << booking::hours::FormatTimeOfDay(special.open_time) << "-" << booking::hours::FormatTimeOfDay(special.close_time);
      }
      if (!special.reason.empty()) std::cout << "  " << special.reason;
      std::cout << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

} // namespace

int main(int argc, char** argv) {
  int         first = 1;
  std::string config_path;
  if (argc >= 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
    first       = 3;
  }
  if (argc <= first) {
    Usage();
    return 1;
  }
  const std::string cmd = argv[first];

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? booking::runtime::config::RuntimeConfig{} : booking::config::ConfigLoader::LoadFromYaml(config_path);

    booking::observability::InitializeTracing(config.observability());
    booking::observability::InitializeMetrics(config.observability());
    booking::observability::InitializeLogging(config.logging());

    auto app  = booking::factory::Build(config);
    int  code = RunCommand(cmd, ParseArgs(argc, argv, first + 1), app);

    booking::observability::ShutdownLogging();
    booking::observability::ShutdownMetrics();
    booking::observability::ShutdownTracing();
    return code;
  } catch (const booking::util::Conflict& e) {
    std::cerr << "conflict with: " << Join(e.booking_ids()) << "\n";
    BOOKING_LOG_ERROR("Booking rejected", {booking::observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    BOOKING_LOG_ERROR("Fatal error", {booking::observability::StringField("error", e.what())});
  }

  booking::observability::ShutdownLogging();
  booking::observability::ShutdownMetrics();
  booking::observability::ShutdownTracing();
  return 2;
}
