#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "tablebook/v1_services.hpp"

using namespace tablebook::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  tablebookctl <addr> availability <restaurant> <date> <party_size> [preferred_time]\n"
            << "  tablebookctl <addr> tables <restaurant> <date> <time> <party_size>\n"
            << "  tablebookctl <addr> book <restaurant> <date> <time> <party_size> <name> [table=<id>] [override=<reason>]\n"
            << "  tablebookctl <addr> cancel <booking_id> [reason]\n"
            << "  tablebookctl <addr> status <booking_id> <confirmed|seated|completed|cancelled|no_show>\n"
            << "  tablebookctl <addr> get <booking_id>\n"
            << "  tablebookctl <addr> list <restaurant> <date>\n"
            << "  tablebookctl <addr> locks [sweep]\n";
}

static std::optional<BookingStatus> ParseStatus(const std::string& value) {
  if (value == "pending") return BOOKING_STATUS_PENDING;
  if (value == "confirmed") return BOOKING_STATUS_CONFIRMED;
  if (value == "seated") return BOOKING_STATUS_SEATED;
  if (value == "completed") return BOOKING_STATUS_COMPLETED;
  if (value == "cancelled") return BOOKING_STATUS_CANCELLED;
  if (value == "no_show") return BOOKING_STATUS_NO_SHOW;
  return std::nullopt;
}

static std::optional<uint32_t> ParseCount(const std::string& value) {
  char*               end    = nullptr;
  const unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
  if (value.empty() || !end || *end != '\0') return std::nullopt;
  return static_cast<uint32_t>(parsed);
}

static void PrintBooking(const Booking& b) {
  std::cout << "id=" << b.id() << " code=" << b.confirmation_code() << " date=" << b.date() << " time=" << b.time()
            << " party=" << b.party_size() << " duration=" << b.duration_minutes() << " table=" << b.table_id();
  for (const auto& id : b.combined_table_ids()) std::cout << "+" << id;
  std::cout << " status=" << BookingStatus_Name(b.status());
  if (b.pacing_overridden()) std::cout << " override=\"" << b.override_reason() << "\"";
  std::cout << "\n";
}

static void PrintConflict(const BookingConflict& c) {
  std::cout << "conflict=" << ConflictReason_Name(c.reason()) << " status=" << PacingStatus_Name(c.pacing_status())
            << " utilization=" << c.utilization_percent() << "% message=\"" << c.message() << "\"\n";
  if (c.alternative_times_size() > 0) {
    std::cout << "alternatives:";
    for (const auto& t : c.alternative_times()) std::cout << " " << t;
    std::cout << "\n";
  }
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto availability_stub = AvailabilityService::NewStub(channel);
  auto booking_stub      = BookingService::NewStub(channel);
  auto admin_stub        = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "availability") {
    if (argc < 6) return 1;

    auto party = ParseCount(argv[5]);
    if (!party) {
      std::cerr << "invalid party size: " << argv[5] << "\n";
      return 1;
    }

    GetAvailabilityRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_date(argv[4]);
    req.set_party_size(*party);
    if (argc >= 7) req.set_preferred_time(argv[6]);

    GetAvailabilityResponse resp;
    auto                    status = availability_stub->GetAvailability(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "duration=" << resp.duration_minutes() << " failed_slots=" << resp.failed_slots() << "\n";
    for (const auto& slot : resp.slots()) {
      std::cout << slot.time() << " " << PacingStatus_Name(slot.status()) << " util=" << slot.utilization_percent()
                << "% tables=" << slot.tables_available() << " covers=" << slot.committed_covers();
      if (!slot.error().empty()) std::cout << " error=\"" << slot.error() << "\"";
      if (slot.alternative_times_size() > 0) {
        std::cout << " alternatives=";
        for (int i = 0; i < slot.alternative_times_size(); ++i) std::cout << (i ? "," : "") << slot.alternative_times(i);
      }
      std::cout << "\n";
    }
    std::cout << "best:";
    for (const auto& t : resp.suggestions().best_availability()) std::cout << " " << t;
    std::cout << "\n";
    if (resp.preferred_time_alternatives_size() > 0) {
      std::cout << "preferred alternatives:";
      for (const auto& t : resp.preferred_time_alternatives()) std::cout << " " << t;
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tables") {
    if (argc < 7) return 1;

    auto party = ParseCount(argv[6]);
    if (!party) {
      std::cerr << "invalid party size: " << argv[6] << "\n";
      return 1;
    }

    GetAvailableTablesRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_date(argv[4]);
    req.set_time(argv[5]);
    req.set_party_size(*party);

    GetAvailableTablesResponse resp;
    auto                       status = availability_stub->GetAvailableTables(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "available=" << resp.total_available() << " duration=" << resp.duration_minutes() << "\n";
    for (const auto& t : resp.tables()) {
      std::cout << t.id() << " #" << t.number() << " " << t.min_capacity() << "-" << t.max_capacity() << "\n";
    }
    if (resp.has_suggested_table()) std::cout << "suggested=" << resp.suggested_table().id() << "\n";
    if (resp.suggested_combination_size() > 0) {
      std::cout << "combination=";
      for (int i = 0; i < resp.suggested_combination_size(); ++i) std::cout << (i ? "+" : "") << resp.suggested_combination(i).id();
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "book") {
    if (argc < 8) return 1;

    auto party = ParseCount(argv[6]);
    if (!party) {
      std::cerr << "invalid party size: " << argv[6] << "\n";
      return 1;
    }

    CreateBookingRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_date(argv[4]);
    req.set_time(argv[5]);
    req.set_party_size(*party);
    req.mutable_customer()->set_name(argv[7]);
    req.set_source(BOOKING_SOURCE_STAFF);
    req.set_created_by("tablebookctl");

    for (int i = 8; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg.rfind("table=", 0) == 0) {
        req.set_table_id(arg.substr(6));
      } else if (arg.rfind("override=", 0) == 0) {
        req.set_override_pacing(true);
        req.set_override_reason(arg.substr(9));
      } else {
        std::cerr << "unknown option: " << arg << "\n";
        return 1;
      }
    }

    CreateBookingResponse resp;
    auto                  status = booking_stub->CreateBooking(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (resp.has_conflict()) {
      PrintConflict(resp.conflict());
      return 3;
    }
    PrintBooking(resp.booking());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    if (argc < 4) return 1;

    CancelBookingRequest req;
    req.set_booking_id(argv[3]);
    if (argc >= 5) req.set_reason(argv[4]);

    CancelBookingResponse resp;
    auto                  status = booking_stub->CancelBooking(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBooking(resp.booking());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    if (argc < 5) return 1;

    auto parsed = ParseStatus(argv[4]);
    if (!parsed.has_value()) {
      std::cerr << "unsupported status: " << argv[4] << "\n";
      return 1;
    }

    UpdateBookingStatusRequest req;
    req.set_booking_id(argv[3]);
    req.set_status(parsed.value());

    UpdateBookingStatusResponse resp;
    auto                        status = booking_stub->UpdateBookingStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBooking(resp.booking());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetBookingRequest req;
    req.set_booking_id(argv[3]);

    GetBookingResponse resp;
    auto               status = booking_stub->GetBooking(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintBooking(resp.booking());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 5) return 1;

    ListBookingsRequest req;
    req.set_restaurant_id(argv[3]);
    req.set_date(argv[4]);

    ListBookingsResponse resp;
    auto                 status = booking_stub->ListBookings(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& b : resp.bookings()) PrintBooking(b);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "locks") {
    if (argc >= 4 && std::string(argv[3]) == "sweep") {
      SweepExpiredLocksResponse resp;
      auto                      status = admin_stub->SweepExpiredLocks(&ctx, SweepExpiredLocksRequest{}, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "removed=" << resp.removed() << "\n";
      return 0;
    }

    LockStatsResponse resp;
    auto              status = admin_stub->GetLockStats(&ctx, LockStatsRequest{}, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "total=" << resp.total() << " active=" << resp.active() << " expired=" << resp.expired() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
