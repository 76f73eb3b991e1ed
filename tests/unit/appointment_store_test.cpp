#include "internal/store/repository_appointment_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using booking::db::memory::MemoryRepository;
using booking::model::BookingStatus;
using booking::model::TimeInterval;
using booking::store::RepositoryAppointmentStore;
using booking::store::ResourceInfo;
using booking::util::ParseTimestamp;

TimeInterval At(const char* start, const char* end) {
  return TimeInterval{ParseTimestamp(start), ParseTimestamp(end)};
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

std::shared_ptr<RepositoryAppointmentStore> MakeStore(std::shared_ptr<booking::db::Repository> repository = nullptr) {
  if (!repository) repository = std::make_shared<MemoryRepository>();
  auto store = std::make_shared<RepositoryAppointmentStore>(std::move(repository));
  store->RegisterResource(ResourceInfo{"r1", "Ana"});
  store->RegisterResource(ResourceInfo{"r2", "Ben"});
  return store;
}

const TimeInterval kMonday = At("2024-01-15T00:00", "2024-01-16T00:00");

/*
  Fails the first `failures` commits of write transactions with
  SerializationFailure, as a concurrent committer would.
*/
class FlakyRepository final : public booking::db::Repository {
 public:
  explicit FlakyRepository(int failures) : failures_(failures) {
  }

  std::unique_ptr<booking::db::Transaction> Begin(const booking::db::TxOptions& options) override {
    return std::make_unique<FlakyTransaction>(inner_.Begin(options), this);
  }

  booking::db::Result LockResource(booking::db::Transaction& tx, const std::optional<std::string>& resource_id) override {
    return inner_.LockResource(Inner(tx), resource_id);
  }
  booking::db::Result InsertBooking(booking::db::Transaction& tx, const booking::db::model::BookingRecord& record) override {
    Writes(tx);
    return inner_.InsertBooking(Inner(tx), record);
  }
  std::optional<booking::db::model::BookingRecord> GetBooking(booking::db::Transaction& tx, const std::string& id) override {
    return inner_.GetBooking(Inner(tx), id);
  }
  std::optional<booking::db::model::BookingRecord> LockBooking(booking::db::Transaction& tx, const std::string& id) override {
    return inner_.LockBooking(Inner(tx), id);
  }
  booking::db::Result UpdateBooking(booking::db::Transaction& tx, const booking::db::model::BookingRecord& record) override {
    Writes(tx);
    return inner_.UpdateBooking(Inner(tx), record);
  }
  std::vector<booking::db::model::BookingRecord> ListBookings(booking::db::Transaction& tx, const booking::db::BookingQuery& query) override {
    return inner_.ListBookings(Inner(tx), query);
  }
  booking::db::Result UpsertResource(booking::db::Transaction& tx, const booking::db::model::ResourceRecord& record) override {
    return inner_.UpsertResource(Inner(tx), record);
  }
  std::vector<booking::db::model::ResourceRecord> ListResources(booking::db::Transaction& tx) override {
    return inner_.ListResources(Inner(tx));
  }

  int commits_attempted = 0;

 private:
  struct FlakyTransaction final : public booking::db::Transaction {
    FlakyTransaction(std::unique_ptr<booking::db::Transaction> inner, FlakyRepository* repo) : inner_(std::move(inner)), repo_(repo) {
    }

    void Commit() override {
      if (writes_) {
        ++repo_->commits_attempted;
        if (repo_->failures_ > 0) {
          --repo_->failures_;
          throw booking::db::DbError(booking::db::ErrorCode::SerializationFailure, "injected serialization failure");
        }
      }
      inner_->Commit();
    }
    void Rollback() override {
      inner_->Rollback();
    }
    bool IsCommitted() const override {
      return inner_->IsCommitted();
    }

    std::unique_ptr<booking::db::Transaction> inner_;
    FlakyRepository*                          repo_;
    bool                                      writes_ = false;
  };

  static booking::db::Transaction& Inner(booking::db::Transaction& tx) {
    return *static_cast<FlakyTransaction&>(tx).inner_;
  }
  static void Writes(booking::db::Transaction& tx) {
    static_cast<FlakyTransaction&>(tx).writes_ = true;
  }

  MemoryRepository inner_;
  int              failures_;
};

void TestCreateThenRead() {
  auto       store = MakeStore();
  const auto id    = store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), R"({"client":"c-17"})");

  const auto booking = store->GetBooking(id);
  assert(booking.has_value());
  assert(booking->interval == At("2024-01-15T10:00", "2024-01-15T11:00"));
  assert(booking->resource_id == std::optional<std::string>("r1"));
  assert(booking->status == BookingStatus::kScheduled);

  const auto listed = store->ListBookings(kMonday, std::vector<std::string>{"r1"}, std::nullopt);
  assert(listed.size() == 1 && listed[0].id == id);
  assert(store->ListBookings(kMonday, std::vector<std::string>{"r2"}, std::nullopt).empty());
  assert(!store->GetBooking("missing").has_value());

  const auto resources = store->ListResources(std::nullopt);
  assert(resources.size() == 2 && resources[0].id == "r1" && resources[1].display_name == "Ben");
}

void TestOverlappingCreateIsRejectedWithIds() {
  auto       store = MakeStore();
  const auto first = store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  try {
    store->CreateBooking(At("2024-01-15T10:30", "2024-01-15T11:30"), std::string("r1"), "");
    assert(false && "overlapping booking must be rejected");
  } catch (const booking::util::Conflict& conflict) {
    assert((conflict.booking_ids() == std::vector<std::string>{first}));
  }

  // touching, other resource, and unassigned-versus-resource are all fine
  store->CreateBooking(At("2024-01-15T11:00", "2024-01-15T12:00"), std::string("r1"), "");
  store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r2"), "");
  assert(store->ListBookings(kMonday, std::nullopt, std::nullopt).size() == 3);
}

void TestUnassignedBookingChecksWholePool() {
  auto store = MakeStore();
  store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  assert(Throws<booking::util::Conflict>([&] { store->CreateBooking(At("2024-01-15T10:30", "2024-01-15T11:30"), std::nullopt, ""); }));

  const auto walk_in = store->CreateBooking(At("2024-01-15T14:00", "2024-01-15T15:00"), std::nullopt, "");
  // resource writers only see their own calendar
  store->CreateBooking(At("2024-01-15T14:00", "2024-01-15T15:00"), std::string("r2"), "");

  const auto all = store->ListBookings(kMonday, std::nullopt, std::nullopt);
  assert(all.size() == 3);
  assert(store->ListBookings(kMonday, std::vector<std::string>{"r2"}, std::nullopt).size() == 1);
  assert(!store->GetBooking(walk_in)->resource_id.has_value());
}

void TestCreateValidatesInput() {
  auto store = MakeStore();
  assert(Throws<booking::util::InvalidArgument>(
      [&] { store->CreateBooking(At("2024-01-15T11:00", "2024-01-15T10:00"), std::string("r1"), ""); }));
  assert(Throws<booking::util::InvalidArgument>(
      [&] { store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("ghost"), ""); }));
  assert(Throws<booking::util::InvalidArgument>([&] { store->RegisterResource(ResourceInfo{"", "nobody"}); }));
  assert(store->ListBookings(kMonday, std::nullopt, std::nullopt).empty());
}

void TestCancelIsIdempotentAndFreesTime() {
  auto       store = MakeStore();
  const auto id    = store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  store->CancelBooking(id);
  store->CancelBooking(id);
  assert(store->GetBooking(id)->status == BookingStatus::kCancelled);
  assert(store->ListBookings(kMonday, std::nullopt, std::nullopt).empty());

  store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");
  assert(Throws<booking::util::NotFound>([&] { store->CancelBooking("missing"); }));
}

void TestUpdateBookingTime() {
  auto       store  = MakeStore();
  const auto moving = store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");
  const auto other  = store->CreateBooking(At("2024-01-15T13:00", "2024-01-15T14:00"), std::string("r1"), "");

  // overlapping only itself is allowed
  store->UpdateBookingTime(moving, At("2024-01-15T10:30", "2024-01-15T11:30"));
  assert(store->GetBooking(moving)->interval == At("2024-01-15T10:30", "2024-01-15T11:30"));

  try {
    store->UpdateBookingTime(moving, At("2024-01-15T12:30", "2024-01-15T13:30"));
    assert(false && "moving onto another booking must be rejected");
  } catch (const booking::util::Conflict& conflict) {
    assert((conflict.booking_ids() == std::vector<std::string>{other}));
  }
  assert(store->GetBooking(moving)->interval == At("2024-01-15T10:30", "2024-01-15T11:30"));

  assert(Throws<booking::util::NotFound>([&] { store->UpdateBookingTime("missing", At("2024-01-15T15:00", "2024-01-15T16:00")); }));

  store->CancelBooking(other);
  assert(Throws<booking::util::InvalidArgument>([&] { store->UpdateBookingTime(other, At("2024-01-15T15:00", "2024-01-15T16:00")); }));
}

void TestRetriedCommitRechecksOverlap() {
  auto repository = std::make_shared<FlakyRepository>(1);
  auto store      = MakeStore(repository);

  const auto id = store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");
  assert(store->GetBooking(id).has_value());
  assert(repository->commits_attempted == 2);
}

void TestExhaustedRetriesSurfaceAsStoreUnavailable() {
  auto repository = std::make_shared<FlakyRepository>(1000);
  auto store      = MakeStore(repository);

  assert(Throws<booking::util::StoreUnavailable>(
      [&] { store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), ""); }));
  assert(repository->commits_attempted == 3);
  assert(store->ListBookings(kMonday, std::nullopt, std::nullopt).empty());
}

void TestExpiredDeadlineFailsRead() {
  auto store = MakeStore();
  assert(Throws<booking::util::StoreUnavailable>(
      [&] { store->ListBookings(kMonday, std::nullopt, booking::util::Now() - std::chrono::seconds(1)); }));
  assert(Throws<booking::util::StoreUnavailable>([&] { store->ListResources(booking::util::Now() - std::chrono::seconds(1)); }));
}

booking::db::model::BookingRecord Record(const std::string& id, const std::optional<std::string>& resource, const char* start, const char* end) {
  booking::db::model::BookingRecord record;
  record.id          = id;
  record.resource_id = resource;
  record.start_ms    = booking::util::ToUnixMillis(ParseTimestamp(start));
  record.end_ms      = booking::util::ToUnixMillis(ParseTimestamp(end));
  record.status      = "scheduled";
  return record;
}

void TestInterleavedWritersOnDifferentResourcesBothCommit() {
  MemoryRepository repo;
  booking::db::BookingQuery monday{.start_ms = booking::util::ToUnixMillis(kMonday.start), .end_ms = booking::util::ToUnixMillis(kMonday.end)};

  auto tx1 = repo.Begin({});
  auto tx2 = repo.Begin({});

  assert(repo.LockResource(*tx1, std::string("r1")));
  assert(repo.LockResource(*tx2, std::string("r2")));

  monday.resource_ids = std::vector<std::string>{"r1"};
  assert(repo.ListBookings(*tx1, monday).empty());
  monday.resource_ids = std::vector<std::string>{"r2"};
  assert(repo.ListBookings(*tx2, monday).empty());

  assert(repo.InsertBooking(*tx1, Record("b1", std::string("r1"), "2024-01-15T10:00", "2024-01-15T11:00")));
  assert(repo.InsertBooking(*tx2, Record("b2", std::string("r2"), "2024-01-15T10:00", "2024-01-15T11:00")));
  tx1->Commit();
  tx2->Commit();

  auto check = repo.Begin({});
  monday.resource_ids.reset();
  assert(repo.ListBookings(*check, monday).size() == 2);
  check->Commit();
}

void TestUnassignedWriterSeesResourceCommitsMadeAfterItsSnapshot() {
  MemoryRepository repo;
  const booking::db::BookingQuery monday{.start_ms = booking::util::ToUnixMillis(kMonday.start), .end_ms = booking::util::ToUnixMillis(kMonday.end)};

  auto pool_writer = repo.Begin({});

  auto resource_writer = repo.Begin({});
  assert(repo.LockResource(*resource_writer, std::string("r1")));
  assert(repo.InsertBooking(*resource_writer, Record("b1", std::string("r1"), "2024-01-15T10:00", "2024-01-15T11:00")));
  resource_writer->Commit();

  // taking the lock moves the snapshot past the commit above
  assert(repo.LockResource(*pool_writer, std::nullopt));
  assert(repo.ListBookings(*pool_writer, monday).size() == 1);
  pool_writer->Rollback();
}

void TestRescheduleReadBeforeCancelMustRetry() {
  auto repository = std::make_shared<MemoryRepository>();
  auto store      = MakeStore(repository);
  const auto id   = store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  auto reschedule = repository->Begin({});
  auto record     = repository->LockBooking(*reschedule, id);
  assert(record && record->status == "scheduled");

  store->CancelBooking(id);

  const auto locked = repository->LockResource(*reschedule, record->resource_id);
  assert(!locked && locked.code == booking::db::ErrorCode::SerializationFailure);
  reschedule->Rollback();

  // the store replays the whole transaction and sees the cancel
  assert(Throws<booking::util::InvalidArgument>([&] { store->UpdateBookingTime(id, At("2024-01-15T12:00", "2024-01-15T13:00")); }));
  assert(store->GetBooking(id)->status == BookingStatus::kCancelled);
}

void TestStaleWriteOfSameRowFailsAtCommit() {
  auto repository = std::make_shared<MemoryRepository>();
  auto store      = MakeStore(repository);
  const auto id   = store->CreateBooking(At("2024-01-15T10:00", "2024-01-15T11:00"), std::string("r1"), "");

  auto stale  = repository->Begin({});
  auto record = repository->LockBooking(*stale, id);
  store->CancelBooking(id);

  record->status = "confirmed";
  assert(repository->UpdateBooking(*stale, *record));
  bool rejected = false;
  try {
    stale->Commit();
  } catch (const booking::db::DbError& e) {
    rejected = e.code() == booking::db::ErrorCode::SerializationFailure;
  }
  assert(rejected);
  assert(store->GetBooking(id)->status == BookingStatus::kCancelled);
}

} // namespace

int main() {
  TestCreateThenRead();
  TestOverlappingCreateIsRejectedWithIds();
  TestUnassignedBookingChecksWholePool();
  TestCreateValidatesInput();
  TestCancelIsIdempotentAndFreesTime();
  TestUpdateBookingTime();
  TestRetriedCommitRechecksOverlap();
  TestExhaustedRetriesSurfaceAsStoreUnavailable();
  TestExpiredDeadlineFailsRead();
  TestInterleavedWritersOnDifferentResourcesBothCommit();
  TestUnassignedWriterSeesResourceCommitsMadeAfterItsSnapshot();
  TestRescheduleReadBeforeCancelMustRetry();
  TestStaleWriteOfSameRowFailsAtCommit();

  std::cout << "booking_unit_appointment_store: pass\n";
  return 0;
}
