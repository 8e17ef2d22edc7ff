#pragma once

#include "helpers.hpp"

#include <transfer/negotiation_client.hpp>
#include <transfer/mocks/backend_api_mock.hpp>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace Transfer::Test
{
    using ::testing::_;
    using ::testing::NiceMock;
    using ::testing::Return;

    class NegotiationClientTests : public ::testing::Test
    {
      protected:
        NegotiationClient makeClient(std::size_t chunkSize = 1000)
        {
            return NegotiationClient{
                backend_,
                NegotiationClient::Options{
                    .negotiationChunkSize = chunkSize,
                    .deleteChunkSize = chunkSize,
                    .retry = RetryPolicy{.maxAttempts = 3, .backoff = std::chrono::milliseconds{1}},
                },
            };
        }

        static std::vector<SharedData::DestinationRequest> makeRequests(std::size_t count)
        {
            std::vector<SharedData::DestinationRequest> requests{};
            for (std::size_t i = 0; i != count; ++i)
                requests.push_back({.filename = "file_" + std::to_string(i) + ".bin", .fileSize = 100});
            return requests;
        }

        static std::vector<Ids::FileId> makeFileIds(std::size_t count)
        {
            std::vector<Ids::FileId> ids{};
            for (std::size_t i = 0; i != count; ++i)
                ids.push_back(Ids::makeFileId(std::to_string(i + 1)));
            return ids;
        }

      protected:
        std::shared_ptr<NiceMock<BackendApiMock>> backend_{std::make_shared<NiceMock<BackendApiMock>>()};
        std::atomic_int nextFileId_{1};
    };

    TEST_F(NegotiationClientTests, DestinationsArePositionalToRequests)
    {
        ON_CALL(*backend_, negotiateDestinations(_)).WillByDefault([this](auto const& requests) {
            return destinationsFor(requests, nextFileId_);
        });

        auto client = makeClient(2);
        const auto results = client.requestDestinations(makeRequests(5));

        ASSERT_EQ(results.size(), 5);
        for (std::size_t i = 0; i != results.size(); ++i)
        {
            ASSERT_TRUE(results[i].has_value());
            EXPECT_EQ(results[i]->remoteKey, "uploads/file_" + std::to_string(i) + ".bin");
        }
    }

    TEST_F(NegotiationClientTests, ServerErrorFailsTheWholeChunkAfterRetries)
    {
        EXPECT_CALL(*backend_, negotiateDestinations(_))
            .Times(3)
            .WillRepeatedly(Return(std::unexpected(BackendError{.httpStatus = 500, .message = "boom"})));

        auto client = makeClient();
        const auto results = client.requestDestinations(makeRequests(5));

        ASSERT_EQ(results.size(), 5);
        for (auto const& result : results)
        {
            ASSERT_FALSE(result.has_value());
            EXPECT_EQ(result.error().type, SharedData::TransferErrorType::Transient);
            EXPECT_EQ(result.error().httpStatus, 500);
            EXPECT_EQ(result.error().message, results.front().error().message);
        }
    }

    TEST_F(NegotiationClientTests, ClientErrorIsNotRetried)
    {
        EXPECT_CALL(*backend_, negotiateDestinations(_))
            .Times(1)
            .WillOnce(Return(std::unexpected(BackendError{.httpStatus = 400, .message = "bad name"})));

        auto client = makeClient();
        const auto results = client.requestDestinations(makeRequests(2));

        ASSERT_EQ(results.size(), 2);
        ASSERT_FALSE(results[0].has_value());
        EXPECT_EQ(results[0].error().type, SharedData::TransferErrorType::Negotiation);
    }

    TEST_F(NegotiationClientTests, RejectedCredentialsAreAuthenticationErrors)
    {
        EXPECT_CALL(*backend_, negotiateDestinations(_))
            .WillOnce(Return(std::unexpected(BackendError{.httpStatus = 401, .message = "expired"})));

        auto client = makeClient();
        const auto results = client.requestDestinations(makeRequests(1));
        ASSERT_FALSE(results[0].has_value());
        EXPECT_EQ(results[0].error().type, SharedData::TransferErrorType::Authentication);
    }

    TEST_F(NegotiationClientTests, FailedChunkDoesNotAffectOtherChunks)
    {
        EXPECT_CALL(*backend_, negotiateDestinations(_))
            .WillOnce([this](auto const& requests) {
                return destinationsFor(requests, nextFileId_);
            })
            .WillOnce(Return(std::unexpected(BackendError{.httpStatus = 403, .message = "quota"})))
            .WillOnce([this](auto const& requests) {
                return destinationsFor(requests, nextFileId_);
            });

        auto client = makeClient(2);
        const auto results = client.requestDestinations(makeRequests(5));

        ASSERT_EQ(results.size(), 5);
        EXPECT_TRUE(results[0].has_value());
        EXPECT_TRUE(results[1].has_value());
        EXPECT_FALSE(results[2].has_value());
        EXPECT_FALSE(results[3].has_value());
        EXPECT_TRUE(results[4].has_value());
    }

    TEST_F(NegotiationClientTests, LengthMismatchFailsTheChunk)
    {
        EXPECT_CALL(*backend_, negotiateDestinations(_)).WillOnce([this](auto const& requests) {
            auto destinations = destinationsFor(requests, nextFileId_);
            destinations.pop_back();
            return destinations;
        });

        auto client = makeClient();
        const auto results = client.requestDestinations(makeRequests(3));

        ASSERT_EQ(results.size(), 3);
        for (auto const& result : results)
        {
            ASSERT_FALSE(result.has_value());
            EXPECT_EQ(result.error().type, SharedData::TransferErrorType::Negotiation);
        }
    }

    TEST_F(NegotiationClientTests, CancelledNegotiationDoesNotCallTheBackend)
    {
        EXPECT_CALL(*backend_, negotiateDestinations(_)).Times(0);

        CancellationSignal cancel{};
        cancel.cancel();
        auto client = makeClient();
        const auto results = client.requestDestinations(makeRequests(2), cancel);

        ASSERT_EQ(results.size(), 2);
        EXPECT_FALSE(results[0].has_value());
    }

    TEST_F(NegotiationClientTests, BulkDeleteIsSplitIntoChunks)
    {
        std::vector<std::size_t> chunkSizes{};
        EXPECT_CALL(*backend_, bulkDelete(_)).Times(2).WillRepeatedly([&chunkSizes](auto const& ids) {
            chunkSizes.push_back(ids.size());
            return SharedData::BulkDeleteResult{.successCount = ids.size()};
        });

        std::vector<std::uint64_t> progress{};
        auto client = makeClient();
        const auto result = client.bulkDelete(makeFileIds(1500), [&progress](auto completed, auto total) {
            EXPECT_EQ(total, 1500U);
            progress.push_back(completed);
        });

        EXPECT_EQ(chunkSizes, (std::vector<std::size_t>{1000, 500}));
        EXPECT_EQ(progress, (std::vector<std::uint64_t>{1000, 1500}));
        EXPECT_EQ(result.successCount, 1500);
        EXPECT_TRUE(result.failedItems.empty());
    }

    TEST_F(NegotiationClientTests, FailedDeleteChunkReportsEveryIdAsFailed)
    {
        EXPECT_CALL(*backend_, bulkDelete(_))
            .WillOnce([](auto const& ids) {
                return SharedData::BulkDeleteResult{
                    .successCount = ids.size() - 1,
                    .failedItems = {{.fileId = ids.front(), .filename = "a.txt", .error = "locked"}},
                };
            })
            .WillOnce(Return(std::unexpected(BackendError{.httpStatus = 404, .message = "gone"})));

        auto client = makeClient(3);
        const auto result = client.bulkDelete(makeFileIds(5));

        EXPECT_EQ(result.successCount, 2);
        ASSERT_EQ(result.failedItems.size(), 3);
        EXPECT_EQ(result.failedItems[0].error, "locked");
        EXPECT_EQ(result.failedItems[1].fileId, Ids::makeFileId("4"));
    }

    TEST_F(NegotiationClientTests, CommitStopsAtTheFirstFailedChunk)
    {
        EXPECT_CALL(*backend_, commitCompletion(_))
            .Times(1)
            .WillOnce(Return(std::unexpected(BackendError{.httpStatus = 409, .message = "unknown file"})));

        auto client = makeClient(2);
        const auto result = client.commitCompletion(makeFileIds(4));
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::TransferErrorType::Commit);
    }
}
