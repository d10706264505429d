#include "internal/token/token_factory.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/token_fixtures.hpp"

namespace {

using namespace freightline::token;
using namespace freightline::testing;
using freightline::util::ErrorKind;

template <typename Fn>
std::string ExpectError(ErrorKind kind, Fn&& fn) {
  try {
    fn();
  } catch (const freightline::util::Error& e) {
    assert(e.Kind() == kind);
    return e.what();
  }
  assert(false && "expected an error");
  return {};
}

bool Mentions(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

void TestCreateShipmentRoot() {
  TokenIndex   index;
  TokenFactory factory(index);

  auto st01 = factory.CreateToken("ST-01", "shp-1", ShipmentMetadata(), {});
  assert(st01.id() == "shp-1");
  assert(st01.type() == TokenType::kShipment);
  assert(st01.parent_shipment_id() == "shp-1");
  assert(st01.state() == TokenState::kCreated);
  assert(st01.version() == 1);
  assert(!st01.signature().has_value());
  assert(st01.relations().empty());
  assert(Equal(st01.metadata(), ShipmentMetadata()));

  // created_at is stored at millisecond precision
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(st01.created_at().time_since_epoch());
  assert(st01.created_at().time_since_epoch() == ms);

  // no id given: a fresh uuid that is its own root
  auto anon = factory.CreateToken("ST-01", "", ShipmentMetadata(), {});
  assert(anon.id().size() == 36);
  assert(anon.parent_shipment_id() == anon.id());

  auto msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ST-01", "shp-1", ShipmentMetadata(), {}); });
  assert(Mentions(msg, "already exists"));
  assert(index.Size() == 2);
}

void TestUnknownTypeIsRejectedFirst() {
  TokenIndex   index;
  TokenFactory factory(index);

  // bad metadata and a dangling parent too; the discriminant wins
  auto msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ZZ-99", "nope", Metadata{}, {}); });
  assert(Mentions(msg, "Unknown token_type"));
  assert(Mentions(msg, "ZZ-99"));

  ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("mt-01", "nope", Metadata{}, {}); });
  assert(index.Size() == 0);
}

void TestMetadataValidation() {
  TokenIndex   index;
  TokenFactory factory(index);
  factory.CreateToken("ST-01", "shp-1", ShipmentMetadata(), {});

  auto missing = ShipmentMetadata();
  missing.mutable_fields()->erase("carrier_id");
  auto msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ST-01", "shp-2", missing, {}); });
  assert(Mentions(msg, "carrier_id"));

  auto empty = ShipmentMetadata();
  SetString(empty, "origin", "");
  ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ST-01", "shp-2", empty, {}); });

  auto null_value = ShipmentMetadata();
  (*null_value.mutable_fields())["origin"].set_null_value(google::protobuf::NULL_VALUE);
  ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ST-01", "shp-2", null_value, {}); });

  auto bad_time = MilestoneMetadata();
  SetString(bad_time, "timestamp", "yesterday");
  msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("MT-01", "shp-1", bad_time, {{"st01_id", "shp-1"}}); });
  assert(Mentions(msg, "timestamp"));

  auto bad_location = MilestoneMetadata();
  SetString(bad_location, "location", "41.88,-87.63");
  ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("MT-01", "shp-1", bad_location, {{"st01_id", "shp-1"}}); });

  auto negative = QuoteMetadata();
  SetNumber(negative, "rate_amount", -1.0);
  ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("QT-01", "shp-1", negative, {{"st01_id", "shp-1"}}); });

  auto currency = PaymentMetadata();
  SetString(currency, "currency", "usd");
  ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("PT-01", "shp-1", currency, {}); });

  auto not_a_list = InvoiceMetadata();
  SetNumber(not_a_list, "line_items", 3);
  ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("IT-01", "shp-1", not_a_list, {}); });

  // every problem is reported at once
  msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("AT-02", "shp-1", Metadata{}, {}); });
  assert(Mentions(msg, "accessorial_type") && Mentions(msg, "amount") && Mentions(msg, "currency"));

  // extra keys are kept
  auto extra = ShipmentMetadata();
  SetBool(extra, "hazmat", true);
  auto st = factory.CreateToken("ST-01", "shp-extra", extra, {});
  assert(st.metadata().fields().contains("hazmat"));

  assert(index.Size() == 2);
}

void TestNonFiniteNumbersAnywhereAreRejected() {
  TokenIndex   index;
  TokenFactory factory(index);
  const double inf = std::numeric_limits<double>::infinity();
  const double nan = std::numeric_limits<double>::quiet_NaN();

  auto optional_inf = ShipmentMetadata();
  SetNumber(optional_inf, "weight_kg", inf);
  auto msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ST-01", "shp-1", optional_inf, {}); });
  assert(Mentions(msg, "weight_kg") && Mentions(msg, "must be finite"));

  auto nested_nan = ShipmentMetadata();
  Metadata dims;
  SetNumber(dims, "length_m", 12.0);
  SetNumber(dims, "height_m", nan);
  SetObject(nested_nan, "dimensions", dims);
  msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ST-01", "shp-1", nested_nan, {}); });
  assert(Mentions(msg, "dimensions.height_m"));
  assert(!Mentions(msg, "length_m"));

  auto listed = ShipmentMetadata();
  auto* readings = (*listed.mutable_fields())["temperatures_c"].mutable_list_value();
  readings->add_values()->set_number_value(4.5);
  readings->add_values()->set_number_value(-inf);
  msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("ST-01", "shp-1", listed, {}); });
  assert(Mentions(msg, "temperatures_c[1]"));

  // a required number is reported once
  auto quote = QuoteMetadata();
  SetNumber(quote, "rate_amount", nan);
  factory.CreateToken("ST-01", "shp-1", ShipmentMetadata(), {});
  msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.CreateToken("QT-01", "shp-1", quote, {{"st01_id", "shp-1"}}); });
  assert(msg.find("rate_amount") == msg.rfind("rate_amount"));

  // finite nested numbers pass
  auto fine = ShipmentMetadata();
  dims.mutable_fields()->erase("height_m");
  SetObject(fine, "dimensions", dims);
  factory.CreateToken("ST-01", "shp-2", fine, {});
  assert(index.Size() == 2);
}

void TestPrepareLeavesIndexUntilRegister() {
  TokenIndex   index;
  TokenFactory factory(index);
  factory.CreateToken("ST-01", "shp-1", ShipmentMetadata(), {});

  auto mt01 = factory.PrepareToken("MT-01", "shp-1", MilestoneMetadata(), {{"st01_id", "shp-1"}});
  assert(index.Size() == 1);
  assert(!index.Lookup(mt01.id()));

  // nothing refers to a prepared token yet
  ExpectError(ErrorKind::kRelationValidation, [&] {
    factory.CreateToken("AT-02", "shp-1", AccessorialMetadata(), {{"mt01_id", mt01.id()}});
  });

  factory.Register(mt01);
  assert(index.Size() == 2);
  assert(index.Lookup(mt01.id()));
  factory.CreateToken("AT-02", "shp-1", AccessorialMetadata(), {{"mt01_id", mt01.id()}});

  auto msg = ExpectError(ErrorKind::kTokenValidation, [&] { factory.Register(mt01); });
  assert(Mentions(msg, "already exists"));
  assert(index.Size() == 3);
}

void TestParentMustBeExistingShipment() {
  TokenIndex   index;
  TokenFactory factory(index);

  auto msg = ExpectError(ErrorKind::kRelationValidation,
                         [&] { factory.CreateToken("MT-01", "missing", MilestoneMetadata(), {{"st01_id", "missing"}}); });
  assert(Mentions(msg, "missing"));

  ExpectError(ErrorKind::kRelationValidation, [&] { factory.CreateToken("QT-01", "", QuoteMetadata(), {}); });

  factory.CreateToken("ST-01", "shp-1", ShipmentMetadata(), {});
  auto quote = factory.CreateToken("QT-01", "shp-1", QuoteMetadata(), {{"st01_id", "shp-1"}});
  msg        = ExpectError(ErrorKind::kRelationValidation,
                           [&] { factory.CreateToken("MT-01", quote.id(), MilestoneMetadata(), {{"st01_id", "shp-1"}}); });
  assert(Mentions(msg, "ST-01"));
}

void TestRelationValidation() {
  TokenIndex   index;
  TokenFactory factory(index);
  auto         chain = MakeChain(factory, "shp-1");
  factory.CreateToken("ST-01", "shp-2", ShipmentMetadata(), {});

  // missing role
  auto msg = ExpectError(ErrorKind::kRelationValidation, [&] { factory.CreateToken("MT-01", "shp-1", MilestoneMetadata(), {}); });
  assert(Mentions(msg, "st01_id"));

  // empty role value
  ExpectError(ErrorKind::kRelationValidation, [&] { factory.CreateToken("MT-01", "shp-1", MilestoneMetadata(), {{"st01_id", ""}}); });

  // dangling
  ExpectError(ErrorKind::kRelationValidation,
              [&] { factory.CreateToken("AT-02", "shp-1", AccessorialMetadata(), {{"mt01_id", "does-not-exist"}}); });

  // wrong target type
  msg = ExpectError(ErrorKind::kRelationValidation,
                    [&] { factory.CreateToken("AT-02", "shp-1", AccessorialMetadata(), {{"mt01_id", chain.qt01.id()}}); });
  assert(Mentions(msg, "MT-01"));

  // target belongs to another shipment
  msg = ExpectError(ErrorKind::kRelationValidation,
                    [&] { factory.CreateToken("MT-01", "shp-2", MilestoneMetadata(), {{"st01_id", "shp-1"}}); });
  assert(Mentions(msg, "crosses shipments"));

  // optional extra relation must resolve too
  ExpectError(ErrorKind::kRelationValidation,
              [&] { factory.CreateToken("MT-01", "shp-1", MilestoneMetadata(), {{"st01_id", "shp-1"}, {"previous", "ghost"}}); });

  auto linked = factory.CreateToken("MT-01", "shp-1", MilestoneMetadata("IN_TRANSIT"), {{"st01_id", "shp-1"}, {"previous", chain.mt01.id()}});
  assert(linked.relations().size() == 2);

  // failed creates left no trace
  assert(index.Size() == 8);
}

void TestLineageIsIndexed() {
  TokenIndex   index;
  TokenFactory factory(index);
  auto         chain = MakeChain(factory, "shp-1");

  assert(chain.mt01.id() != chain.at02.id());
  assert(chain.pt01.parent_shipment_id() == "shp-1");

  auto entry = index.Lookup(chain.it01.id());
  assert(entry && entry->type == TokenType::kInvoice && entry->root_shipment_id == "shp-1");

  auto parents = index.Parents(chain.pt01.id());
  assert(parents.size() == 1 && parents[0].role == "it01_id" && parents[0].other == chain.it01.id());

  auto children = index.Children("shp-1");
  assert(children.size() == 2);

  auto all = index.Descendants("shp-1");
  assert(all.size() == 5);
  auto has = [&](const std::string& id) { return std::find(all.begin(), all.end(), id) != all.end(); };
  assert(has(chain.mt01.id()) && has(chain.at02.id()) && has(chain.qt01.id()) && has(chain.it01.id()) && has(chain.pt01.id()));

  assert(index.Descendants("shp-1", 1).size() == 2);
  assert(index.Descendants(chain.qt01.id()).size() == 2);

  auto ordered = index.TokensForShipment("shp-1");
  assert(ordered.size() == 6);
  assert(ordered.front() == "shp-1");
  assert(ordered.back() == chain.pt01.id());
}

void TestCreateFromRequest() {
  TokenIndex   index;
  TokenFactory factory(index);
  factory.CreateToken("ST-01", "shp-1", ShipmentMetadata(), {});

  TokenRequest request;
  request.token_type         = "MT-01";
  request.parent_shipment_id = "shp-1";
  request.metadata           = MilestoneMetadata("DELIVERED");
  request.relations          = {{"st01_id", "shp-1"}};

  auto token = factory.Create(request);
  assert(token.type() == TokenType::kMilestone);
  assert(GetString(token.metadata(), "milestone_type") == "DELIVERED");
}

} // namespace

int main() {
  TestCreateShipmentRoot();
  TestUnknownTypeIsRejectedFirst();
  TestMetadataValidation();
  TestNonFiniteNumbersAnywhereAreRejected();
  TestPrepareLeavesIndexUntilRegister();
  TestParentMustBeExistingShipment();
  TestRelationValidation();
  TestLineageIsIndexed();
  TestCreateFromRequest();

  std::cout << "freightline_unit_token_factory: pass\n";
  return 0;
}
