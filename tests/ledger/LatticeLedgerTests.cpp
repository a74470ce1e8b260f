/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE LatticeLedgerTests
#include <boost/test/unit_test.hpp>

#include "core/BalanceLedger.hpp"
#include "core/HeightClock.hpp"
#include "ledger/LatticeLedger.hpp"
#include "utils/JsonReader.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace LatticeMint;

// ============================================================================
// Test Fixture
// ============================================================================

class LatticeLedgerFixture {
public:
  LatticeLedgerFixture()
      : balances(std::make_shared<InMemoryBalanceLedger>()),
        clock(std::make_shared<ManualHeightClock>(100)) {
    config.admin = "platform";
    config.platformFeeBps = 250;
    ledger = std::make_unique<LatticeLedger>(config, balances, clock);

    balances->deposit("alice", 10000);
    balances->deposit("bob", 10000);
  }

  ~LatticeLedgerFixture() {
    std::error_code ec;
    std::filesystem::remove_all("test_data/snapshots", ec);
  }

protected:
  static CollectionDraft makeDraft(uint64_t maxSupply, BasisPoints royaltyBps,
                                   Amount mintPrice = 0) {
    CollectionDraft draft;
    draft.name = "Quasicrystal";
    draft.description = "Aperiodic tilings";
    draft.maxSupply = maxSupply;
    draft.mintPrice = mintPrice;
    draft.royaltyBps = royaltyBps;
    draft.metadataLocator = "https://meta.example/qc";
    return draft;
  }

  static LatticeParameters makeParams() {
    LatticeParameters params;
    params.dimensions = 5;
    params.nodeCount = 12;
    params.connections = {{0, 1, 1.0}, {1, 2, 0.5}};
    params.colorScheme = "spectral";
    params.transformations.push_back("penrose");
    params.extraParams.emplace_back("symmetry", "5-fold");
    return params;
  }

  CollectionId createCollection(uint64_t maxSupply = 3,
                                BasisPoints royaltyBps = 500,
                                Amount mintPrice = 0) {
    CollectionId id = INVALID_COLLECTION_ID;
    BOOST_REQUIRE_EQUAL(ledger->createCollection(
                            makeDraft(maxSupply, royaltyBps, mintPrice),
                            makeParams(), "creator", id),
                        LedgerResult::Success);
    return id;
  }

  TokenId mint(CollectionId collectionId, const AccountId &caller,
               uint64_t seed = 1) {
    TokenId tokenId;
    BOOST_REQUIRE_EQUAL(ledger->mint(collectionId, seed, caller, tokenId),
                        LedgerResult::Success);
    return tokenId;
  }

  LedgerConfig config;
  std::shared_ptr<InMemoryBalanceLedger> balances;
  std::shared_ptr<ManualHeightClock> clock;
  std::unique_ptr<LatticeLedger> ledger;
};

// ============================================================================
// CONSTRUCTION
// ============================================================================

BOOST_AUTO_TEST_SUITE(ConstructionTests)

BOOST_AUTO_TEST_CASE(TestInvalidConfigThrows) {
  auto balances = std::make_shared<InMemoryBalanceLedger>();
  auto clock = std::make_shared<ManualHeightClock>();

  LedgerConfig noAdmin;
  BOOST_CHECK_THROW(LatticeLedger(noAdmin, balances, clock),
                    std::invalid_argument);

  LedgerConfig config;
  config.admin = "platform";
  BOOST_CHECK_THROW(LatticeLedger(config, nullptr, clock), std::invalid_argument);
  BOOST_CHECK_THROW(LatticeLedger(config, balances, nullptr),
                    std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestInstancesAreIsolated) {
  auto balances = std::make_shared<InMemoryBalanceLedger>();
  auto clock = std::make_shared<ManualHeightClock>();

  LedgerConfig first;
  first.admin = "first-admin";
  LedgerConfig second;
  second.admin = "second-admin";
  second.platformFeeBps = 100;

  LatticeLedger a(first, balances, clock);
  LatticeLedger b(second, balances, clock);
  BOOST_CHECK_EQUAL(a.setPlatformFeeBps(0, "first-admin"), LedgerResult::Success);

  BOOST_CHECK_EQUAL(a.getPlatformFeeBps(), 0u);
  BOOST_CHECK_EQUAL(b.getPlatformFeeBps(), 100u);
  BOOST_CHECK_EQUAL(b.getAdmin(), "second-admin");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// COLLECTIONS AND MINTING
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CollectionScenarioTests, LatticeLedgerFixture)

BOOST_AUTO_TEST_CASE(TestSupplyCapScenario) {
  CollectionId id = createCollection(3, 500);

  TokenId t1 = mint(id, "alice");
  TokenId t2 = mint(id, "alice");
  TokenId t3 = mint(id, "bob");
  BOOST_CHECK_EQUAL(t1.getTokenIndex(), 1u);
  BOOST_CHECK_EQUAL(t2.getTokenIndex(), 2u);
  BOOST_CHECK_EQUAL(t3.getTokenIndex(), 3u);

  TokenId fourth;
  BOOST_CHECK_EQUAL(ledger->mint(id, 4, "bob", fourth),
                    LedgerResult::CollectionLimitReached);
  BOOST_CHECK_EQUAL(ledger->getCollection(id)->currentSupply, 3u);
  BOOST_CHECK_EQUAL(ledger->getCollectionTokens(id).size(), 3u);
}

BOOST_AUTO_TEST_CASE(TestRecordsCarryClockHeight) {
  clock->advance(5);
  CollectionId id = createCollection();
  BOOST_CHECK_EQUAL(ledger->getCollection(id)->createdAtHeight, 105u);

  clock->advance();
  TokenId tokenId = mint(id, "alice", 99);
  auto token = ledger->getNft(id, tokenId.getTokenIndex());
  BOOST_REQUIRE(token.has_value());
  BOOST_CHECK_EQUAL(token->mintedAtHeight, 106u);
  BOOST_CHECK_EQUAL(token->seed, 99u);
  BOOST_CHECK_EQUAL(token->metadataLocator, "https://meta.example/qc/1");
}

BOOST_AUTO_TEST_CASE(TestLatticeParametersAreReadable) {
  CollectionId id = createCollection();
  auto params = ledger->getLatticeParameters(id);
  BOOST_REQUIRE(params.has_value());
  BOOST_CHECK_EQUAL(params->collectionId, id);
  BOOST_CHECK_EQUAL(params->dimensions, 5u);
  BOOST_CHECK_EQUAL(params->colorScheme, "spectral");
  BOOST_CHECK(!ledger->getLatticeParameters(id + 1).has_value());
}

BOOST_AUTO_TEST_CASE(TestClosedCollectionRefusesMint) {
  CollectionId id = createCollection();
  BOOST_CHECK_EQUAL(ledger->setCollectionStatus(id, false, "alice"),
                    LedgerResult::NotAuthorized);
  BOOST_CHECK_EQUAL(ledger->setCollectionStatus(id, false, "creator"),
                    LedgerResult::Success);

  TokenId tokenId;
  BOOST_CHECK_EQUAL(ledger->mint(id, 1, "alice", tokenId),
                    LedgerResult::CollectionClosed);

  BOOST_CHECK_EQUAL(ledger->setCollectionStatus(id, true, "creator"),
                    LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->mint(id, 1, "alice", tokenId), LedgerResult::Success);
}

BOOST_AUTO_TEST_CASE(TestMintPricePaidToCreator) {
  CollectionId id = createCollection(3, 500, 400);
  mint(id, "alice");
  BOOST_CHECK_EQUAL(balances->balanceOf("alice"), 9600u);
  BOOST_CHECK_EQUAL(balances->balanceOf("creator"), 400u);

  TokenId tokenId;
  BOOST_CHECK_EQUAL(ledger->mint(id, 1, "pauper", tokenId),
                    LedgerResult::InsufficientPayment);
}

BOOST_AUTO_TEST_CASE(TestCollectionQueries) {
  CollectionId first = createCollection();
  CollectionId other = INVALID_COLLECTION_ID;
  BOOST_REQUIRE_EQUAL(ledger->createCollection(makeDraft(2, 0), makeParams(),
                                               "alice", other),
                      LedgerResult::Success);

  BOOST_CHECK_EQUAL(ledger->getCollectionsCount(), 2u);
  BOOST_REQUIRE_EQUAL(ledger->getCollectionsByCreator("creator").size(), 1u);
  BOOST_CHECK_EQUAL(ledger->getCollectionsByCreator("creator")[0], first);
  BOOST_CHECK(!ledger->getCollection(99).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TRANSFERS AND MARKETPLACE
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MarketplaceScenarioTests, LatticeLedgerFixture)

BOOST_AUTO_TEST_CASE(TestReferenceSale) {
  CollectionId id = createCollection(3, 500);
  TokenId tokenId = mint(id, "alice");
  const TokenIndex index = tokenId.getTokenIndex();

  BOOST_REQUIRE_EQUAL(ledger->listForSale(id, index, 1000, "alice"),
                      LedgerResult::Success);

  SettlementSplit split;
  BOOST_CHECK_EQUAL(ledger->buyNft(id, index, "bob", split),
                    LedgerResult::Success);
  BOOST_CHECK_EQUAL(split.price, 1000u);
  BOOST_CHECK_EQUAL(split.platformFee, 25u);
  BOOST_CHECK_EQUAL(split.royalty, 50u);
  BOOST_CHECK_EQUAL(split.sellerAmount, 925u);

  BOOST_CHECK_EQUAL(ledger->getNftOwner(id, index).value(), "bob");
  BOOST_CHECK(!ledger->getListing(id, index).has_value());
  BOOST_CHECK_EQUAL(balances->balanceOf("bob"), 9000u);
  BOOST_CHECK_EQUAL(balances->balanceOf("alice"), 10925u);
  BOOST_CHECK_EQUAL(balances->balanceOf("platform"), 25u);
  BOOST_CHECK_EQUAL(balances->balanceOf("creator"), 50u);

  std::vector<TokenId> owned = ledger->getOwnedNfts("bob");
  BOOST_REQUIRE_EQUAL(owned.size(), 1u);
  BOOST_CHECK_EQUAL(owned[0], tokenId);
  BOOST_CHECK(ledger->getOwnedNfts("alice").empty());
  BOOST_CHECK(ledger->checkInvariants());
}

BOOST_AUTO_TEST_CASE(TestBuyingOwnListingIsRefused) {
  CollectionId id = createCollection();
  TokenId tokenId = mint(id, "alice");
  BOOST_REQUIRE_EQUAL(
      ledger->listForSale(id, tokenId.getTokenIndex(), 500, "alice"),
      LedgerResult::Success);

  SettlementSplit split;
  BOOST_CHECK_EQUAL(ledger->buyNft(id, tokenId.getTokenIndex(), "alice", split),
                    LedgerResult::NotAuthorized);
  BOOST_CHECK(ledger->getListing(id, tokenId.getTokenIndex()).has_value());
}

BOOST_AUTO_TEST_CASE(TestNonOwnerTransferLeavesStateUnchanged) {
  CollectionId id = createCollection();
  TokenId tokenId = mint(id, "alice");
  const TokenIndex index = tokenId.getTokenIndex();

  BOOST_CHECK_EQUAL(ledger->transferNft(id, index, "bob", "bob"),
                    LedgerResult::NotOwner);
  BOOST_CHECK_EQUAL(ledger->getNftOwner(id, index).value(), "alice");
  BOOST_CHECK_EQUAL(ledger->getOwnedNfts("alice").size(), 1u);
  BOOST_CHECK(ledger->getOwnedNfts("bob").empty());

  BOOST_CHECK_EQUAL(ledger->transferNft(id, 3, "bob", "alice"),
                    LedgerResult::NftNotFound);
}

BOOST_AUTO_TEST_CASE(TestTransferRemovesListing) {
  CollectionId id = createCollection();
  TokenId tokenId = mint(id, "alice");
  const TokenIndex index = tokenId.getTokenIndex();

  BOOST_REQUIRE_EQUAL(ledger->listForSale(id, index, 700, "alice"),
                      LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->transferNft(id, index, "bob", "alice"),
                    LedgerResult::Success);
  BOOST_CHECK(!ledger->getListing(id, index).has_value());
  BOOST_CHECK(ledger->getActiveListings().empty());

  SettlementSplit split;
  BOOST_CHECK_EQUAL(ledger->buyNft(id, index, "alice", split),
                    LedgerResult::ListingNotFound);
  BOOST_CHECK(ledger->checkInvariants());
}

BOOST_AUTO_TEST_CASE(TestSelfTransferDropsListing) {
  CollectionId id = createCollection();
  TokenId tokenId = mint(id, "alice");
  const TokenIndex index = tokenId.getTokenIndex();

  BOOST_REQUIRE_EQUAL(ledger->listForSale(id, index, 1000, "alice"),
                      LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->transferNft(id, index, "alice", "alice"),
                    LedgerResult::Success);

  BOOST_CHECK(!ledger->getListing(id, index).has_value());
  BOOST_CHECK_EQUAL(ledger->getNftOwner(id, index).value(), "alice");
  BOOST_CHECK_EQUAL(ledger->getOwnedNfts("alice").size(), 1u);
  BOOST_CHECK_EQUAL(ledger->getStats().transfers.load(), 1u);
  BOOST_CHECK(ledger->checkInvariants());
}

BOOST_AUTO_TEST_CASE(TestCancelTwiceAndRelist) {
  CollectionId id = createCollection();
  TokenId tokenId = mint(id, "alice");
  const TokenIndex index = tokenId.getTokenIndex();

  BOOST_CHECK_EQUAL(ledger->listForSale(id, index, 700, "alice"),
                    LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->listForSale(id, index, 900, "alice"),
                    LedgerResult::ListingExists);
  BOOST_CHECK_EQUAL(ledger->cancelListing(id, index, "bob"),
                    LedgerResult::NotAuthorized);
  BOOST_CHECK_EQUAL(ledger->cancelListing(id, index, "alice"),
                    LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->cancelListing(id, index, "alice"),
                    LedgerResult::ListingNotFound);
  BOOST_CHECK_EQUAL(ledger->listForSale(id, index, 900, "alice"),
                    LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->getListing(id, index)->price, 900u);
  BOOST_CHECK_EQUAL(ledger->getCollectionListings(id).size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestListingOnClosedCollectionStillTrades) {
  CollectionId id = createCollection();
  TokenId tokenId = mint(id, "alice");
  BOOST_REQUIRE_EQUAL(ledger->setCollectionStatus(id, false, "creator"),
                      LedgerResult::Success);

  BOOST_CHECK_EQUAL(
      ledger->listForSale(id, tokenId.getTokenIndex(), 100, "alice"),
      LedgerResult::Success);
  SettlementSplit split;
  BOOST_CHECK_EQUAL(ledger->buyNft(id, tokenId.getTokenIndex(), "bob", split),
                    LedgerResult::Success);
}

BOOST_AUTO_TEST_CASE(TestPortfolioCap) {
  config.maxTokensPerAccount = 2;
  ledger = std::make_unique<LatticeLedger>(config, balances, clock);
  CollectionId id = createCollection(5, 0);

  mint(id, "alice");
  mint(id, "alice");
  TokenId tokenId;
  BOOST_CHECK_EQUAL(ledger->mint(id, 1, "alice", tokenId),
                    LedgerResult::PortfolioFull);

  TokenId bobToken = mint(id, "bob");
  BOOST_CHECK_EQUAL(
      ledger->transferNft(id, bobToken.getTokenIndex(), "alice", "bob"),
      LedgerResult::PortfolioFull);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// PLATFORM ADMINISTRATION
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(AdminTests, LatticeLedgerFixture)

BOOST_AUTO_TEST_CASE(TestFeeChangesAreAdminOnly) {
  BOOST_CHECK_EQUAL(ledger->getPlatformFeeBps(), 250u);
  BOOST_CHECK_EQUAL(ledger->setPlatformFeeBps(100, "alice"),
                    LedgerResult::NotAuthorized);
  BOOST_CHECK_EQUAL(ledger->setPlatformFeeBps(1001, "platform"),
                    LedgerResult::InvalidParameters);
  BOOST_CHECK_EQUAL(ledger->getPlatformFeeBps(), 250u);

  BOOST_CHECK_EQUAL(ledger->setPlatformFeeBps(1000, "platform"),
                    LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->getPlatformFeeBps(), 1000u);
}

BOOST_AUTO_TEST_CASE(TestNewFeeAppliesToNextSale) {
  CollectionId id = createCollection(3, 0);
  TokenId tokenId = mint(id, "alice");
  BOOST_REQUIRE_EQUAL(
      ledger->listForSale(id, tokenId.getTokenIndex(), 1000, "alice"),
      LedgerResult::Success);
  BOOST_REQUIRE_EQUAL(ledger->setPlatformFeeBps(0, "platform"),
                      LedgerResult::Success);

  SettlementSplit split;
  BOOST_REQUIRE_EQUAL(ledger->buyNft(id, tokenId.getTokenIndex(), "bob", split),
                      LedgerResult::Success);
  BOOST_CHECK_EQUAL(split.platformFee, 0u);
  BOOST_CHECK_EQUAL(split.sellerAmount, 1000u);
}

BOOST_AUTO_TEST_CASE(TestAdminHandover) {
  BOOST_CHECK_EQUAL(ledger->setAdmin("alice", "bob"), LedgerResult::NotAuthorized);
  BOOST_CHECK_EQUAL(ledger->setAdmin("", "platform"),
                    LedgerResult::InvalidParameters);
  BOOST_CHECK_EQUAL(ledger->setAdmin("alice", "platform"), LedgerResult::Success);
  BOOST_CHECK_EQUAL(ledger->getAdmin(), "alice");

  // Previous admin has lost its rights
  BOOST_CHECK_EQUAL(ledger->setPlatformFeeBps(0, "platform"),
                    LedgerResult::NotAuthorized);
  BOOST_CHECK_EQUAL(ledger->setPlatformFeeBps(0, "alice"), LedgerResult::Success);
}

BOOST_AUTO_TEST_CASE(TestFeesGoToCurrentAdmin) {
  BOOST_REQUIRE_EQUAL(ledger->setAdmin("treasury", "platform"),
                      LedgerResult::Success);
  CollectionId id = createCollection(3, 0);
  TokenId tokenId = mint(id, "alice");
  BOOST_REQUIRE_EQUAL(
      ledger->listForSale(id, tokenId.getTokenIndex(), 1000, "alice"),
      LedgerResult::Success);

  SettlementSplit split;
  BOOST_REQUIRE_EQUAL(ledger->buyNft(id, tokenId.getTokenIndex(), "bob", split),
                      LedgerResult::Success);
  BOOST_CHECK_EQUAL(balances->balanceOf("treasury"), 25u);
  BOOST_CHECK_EQUAL(balances->balanceOf("platform"), 0u);
}

BOOST_AUTO_TEST_CASE(TestStatsCountOperations) {
  CollectionId id = createCollection();
  mint(id, "alice");
  TokenId rejected;
  BOOST_CHECK_EQUAL(ledger->mint(99, 1, "alice", rejected),
                    LedgerResult::CollectionNotFound);

  LedgerStats stats = ledger->getStats();
  BOOST_CHECK_EQUAL(stats.collectionsCreated.load(), 1u);
  BOOST_CHECK_EQUAL(stats.tokensMinted.load(), 1u);
  BOOST_CHECK_EQUAL(stats.rejectedOperations.load(), 1u);

  ledger->resetStats();
  BOOST_CHECK_EQUAL(ledger->getStats().tokensMinted.load(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// METADATA
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(MetadataTests, LatticeLedgerFixture)

BOOST_AUTO_TEST_CASE(TestTokenMetadataDocument) {
  CollectionId id = createCollection();
  mint(id, "alice");
  TokenId tokenId = mint(id, "bob", 18446744073709551615ULL);

  auto document = ledger->getTokenMetadata(id, tokenId.getTokenIndex());
  BOOST_REQUIRE(document.has_value());

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(*document));
  const JsonValue &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root["name"].asString(), "Quasicrystal #2");
  BOOST_CHECK_EQUAL(root["description"].asString(), "Aperiodic tilings");
  BOOST_CHECK_EQUAL(root["token_index"].tryAsUnsigned().value(), 2u);
  BOOST_CHECK_EQUAL(root["seed"].asString(), "18446744073709551615");
  BOOST_CHECK_EQUAL(root["owner"].asString(), "bob");
  BOOST_CHECK_EQUAL(root["locator"].asString(), "https://meta.example/qc/2");

  const JsonValue &attributes = root["attributes"];
  BOOST_CHECK_EQUAL(attributes["dimensions"].tryAsUnsigned().value(), 5u);
  BOOST_CHECK_EQUAL(attributes["node_count"].tryAsUnsigned().value(), 12u);
  BOOST_CHECK_EQUAL(attributes["color_scheme"].asString(), "spectral");
  BOOST_CHECK_EQUAL(attributes["connections"].size(), 2u);
  BOOST_CHECK_EQUAL(attributes["transformations"].asArray()[0].asString(),
                    "penrose");
  BOOST_CHECK_EQUAL(attributes["extra_params"]["symmetry"].asString(), "5-fold");
}

BOOST_AUTO_TEST_CASE(TestMetadataOfMissingToken) {
  CollectionId id = createCollection();
  BOOST_CHECK(!ledger->getTokenMetadata(id, 1).has_value());
  BOOST_CHECK(!ledger->getTokenMetadata(42, 1).has_value());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SNAPSHOTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SnapshotTests, LatticeLedgerFixture)

BOOST_AUTO_TEST_CASE(TestSnapshotRoundTrip) {
  const std::string path = "test_data/snapshots/ledger.snap";

  CollectionId id = createCollection(5, 500);
  TokenId first = mint(id, "alice", 11);
  TokenId second = mint(id, "alice", 12);
  mint(id, "bob", 13);
  BOOST_REQUIRE_EQUAL(
      ledger->transferNft(id, first.getTokenIndex(), "bob", "alice"),
      LedgerResult::Success);
  BOOST_REQUIRE_EQUAL(
      ledger->listForSale(id, second.getTokenIndex(), 750, "alice"),
      LedgerResult::Success);
  BOOST_REQUIRE_EQUAL(ledger->setCollectionStatus(id, false, "creator"),
                      LedgerResult::Success);
  BOOST_REQUIRE_EQUAL(ledger->setPlatformFeeBps(300, "platform"),
                      LedgerResult::Success);

  BOOST_REQUIRE(ledger->saveSnapshot(path));

  LatticeLedger restored(config, balances, clock);
  BOOST_REQUIRE(restored.loadSnapshot(path));

  BOOST_CHECK_EQUAL(restored.getCollectionsCount(), 1u);
  BOOST_CHECK_EQUAL(restored.getPlatformFeeBps(), 300u);
  BOOST_CHECK_EQUAL(restored.getAdmin(), "platform");

  auto collection = restored.getCollection(id);
  BOOST_REQUIRE(collection.has_value());
  BOOST_CHECK_EQUAL(collection->currentSupply, 3u);
  BOOST_CHECK(!collection->isOpen);

  BOOST_CHECK_EQUAL(restored.getNftOwner(id, first.getTokenIndex()).value(),
                    "bob");
  BOOST_CHECK_EQUAL(restored.getNft(id, second.getTokenIndex())->seed, 12u);
  BOOST_CHECK_EQUAL(restored.getListing(id, second.getTokenIndex())->price,
                    750u);
  BOOST_CHECK_EQUAL(restored.getOwnedNfts("bob").size(), 2u);
  BOOST_CHECK_EQUAL(restored.getOwnedNfts("alice").size(), 1u);
  BOOST_CHECK_EQUAL(restored.getLatticeParameters(id)->transformations.size(),
                    1u);
  BOOST_CHECK(restored.checkInvariants());

  // Index allocation continues where the snapshot left off
  BOOST_REQUIRE_EQUAL(restored.setCollectionStatus(id, true, "creator"),
                      LedgerResult::Success);
  TokenId next;
  BOOST_CHECK_EQUAL(restored.mint(id, 14, "alice", next), LedgerResult::Success);
  BOOST_CHECK_EQUAL(next.getTokenIndex(), 4u);
}

BOOST_AUTO_TEST_CASE(TestFailedLoadKeepsState) {
  const std::string path = "test_data/snapshots/garbage.snap";
  std::filesystem::create_directories("test_data/snapshots");
  {
    std::ofstream file(path, std::ios::binary);
    file << "NOTASNAPSHOT";
  }

  CollectionId id = createCollection();
  mint(id, "alice");

  BOOST_CHECK(!ledger->loadSnapshot(path));
  BOOST_CHECK(!ledger->loadSnapshot("test_data/snapshots/missing.snap"));
  BOOST_CHECK_EQUAL(ledger->getCollectionsCount(), 1u);
  BOOST_CHECK_EQUAL(ledger->getOwnedNfts("alice").size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestTruncatedSnapshotRejected) {
  const std::string path = "test_data/snapshots/truncated.snap";
  CollectionId id = createCollection();
  mint(id, "alice");
  BOOST_REQUIRE(ledger->saveSnapshot(path));

  const auto size = std::filesystem::file_size(path);
  std::filesystem::resize_file(path, size - 4);

  LatticeLedger restored(config, balances, clock);
  BOOST_CHECK(!restored.loadSnapshot(path));
  BOOST_CHECK_EQUAL(restored.getCollectionsCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestTrailingDataRejected) {
  const std::string path = "test_data/snapshots/trailing.snap";
  createCollection();
  BOOST_REQUIRE(ledger->saveSnapshot(path));
  {
    std::ofstream file(path, std::ios::binary | std::ios::app);
    file << "junk";
  }

  LatticeLedger restored(config, balances, clock);
  BOOST_CHECK(!restored.loadSnapshot(path));
  BOOST_CHECK_EQUAL(restored.getCollectionsCount(), 0u);
}

BOOST_AUTO_TEST_SUITE_END()
