#include <gtest/gtest.h>
#include "logbeam.hpp"
#include "utils/test_utils.hpp"
#include "utils/mock_clients.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace logbeam;

class CloudWatchDestinationTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.setLogGroupName("argle")
              .setLogStreamName("bargle")
              .setRetrySleeper(TestUtils::noSleep())
              .setInitializationTimeoutMs(5000);
    }

    CloudWatchDestination& create(bool groupExists = true, bool streamExists = true) {
        std::unique_ptr<MockCloudWatchClient> client(new MockCloudWatchClient(groupExists, streamExists));
        mock = client.get();
        destination.reset(new CloudWatchDestination(config, std::move(client)));
        destination->bind(stats, logger);
        return *destination;
    }

    CloudWatchWriterConfig config;
    WriterStatistics stats;
    CapturingInternalLogger logger;
    std::unique_ptr<CloudWatchDestination> destination;
    MockCloudWatchClient* mock = nullptr;
};

TEST_F(CloudWatchDestinationTest, ExistingGroupAndStream) {
    ASSERT_TRUE(create().ensureDestinationAvailable());

    EXPECT_EQ(destination->kind(), DestinationKind::SequencedStream);
    EXPECT_EQ(mock->findLogGroupCount, 1u);
    EXPECT_EQ(mock->createLogGroupCount, 0u);
    EXPECT_EQ(mock->createLogStreamCount, 0u);
    EXPECT_TRUE(logger.contains(InternalLogLevel::DEBUG, "using existing CloudWatch log group: argle"));
    EXPECT_TRUE(logger.contains(InternalLogLevel::DEBUG, "using existing CloudWatch log stream: bargle"));
    EXPECT_EQ(stats.destinationName("logGroupName"), "argle");
    EXPECT_EQ(stats.destinationName("logStreamName"), "bargle");
}

TEST_F(CloudWatchDestinationTest, CreatesGroupAndStreamAndWaits) {
    config.setRetentionPeriod(7);
    create(false, false);
    mock->setCreationDelay(2);

    ASSERT_TRUE(destination->ensureDestinationAvailable());

    EXPECT_EQ(mock->createLogGroupCount, 1u);
    EXPECT_EQ(mock->createLogStreamCount, 1u);
    // initial lookup plus three polls (two not yet visible)
    EXPECT_EQ(mock->findLogGroupCount, 4u);
    EXPECT_EQ(mock->retrieveSequenceTokenCount, 4u);
    EXPECT_EQ(mock->setRetentionCount, 1u);
    EXPECT_EQ(mock->lastRetention, 7);
    EXPECT_TRUE(logger.contains(InternalLogLevel::DEBUG, "creating CloudWatch log group: argle"));
    EXPECT_TRUE(logger.contains(InternalLogLevel::DEBUG, "creating CloudWatch log stream: bargle"));
}

TEST_F(CloudWatchDestinationTest, RetentionFailureIsNotFatal) {
    config.setRetentionPeriod(3);
    create(false, false);
    mock->retentionFailures.add(std::make_exception_ptr(std::runtime_error("access denied")));

    EXPECT_TRUE(destination->ensureDestinationAvailable());
    EXPECT_TRUE(logger.contains(InternalLogLevel::ERROR, "exception setting retention policy"));
    EXPECT_EQ(stats.lastError().message, "exception setting retention policy");
}

TEST_F(CloudWatchDestinationTest, CreateRetriesThrottling) {
    create(false, true);
    mock->createLogGroupFailures.add(TestUtils::facadeError(ReasonCode::THROTTLING), 2);

    EXPECT_TRUE(destination->ensureDestinationAvailable());
    EXPECT_EQ(mock->createLogGroupCount, 3u);
}

TEST_F(CloudWatchDestinationTest, InvalidConfigurationReportsEveryProblem) {
    config.setLogGroupName("bad group name!")
          .setLogStreamName("  ")
          .setRetentionPeriod(17);
    create();

    EXPECT_FALSE(destination->ensureDestinationAvailable());
    EXPECT_TRUE(logger.contains(InternalLogLevel::ERROR, "invalid log group name: bad group name!"));
    EXPECT_TRUE(logger.contains(InternalLogLevel::ERROR, "blank log stream name"));
    EXPECT_TRUE(logger.contains(InternalLogLevel::ERROR, "invalid retention period: 17"));
    EXPECT_EQ(mock->findLogGroupCount, 0u);
}

TEST_F(CloudWatchDestinationTest, InvalidStreamCharacters) {
    config.setLogStreamName("foo:bar");
    create();

    EXPECT_FALSE(destination->ensureDestinationAvailable());
    EXPECT_TRUE(logger.contains(InternalLogLevel::ERROR, "invalid log stream name: foo:bar"));
}

TEST_F(CloudWatchDestinationTest, ProvisioningFailureReported) {
    create(false, false);
    mock->createLogGroupFailures.setForever(std::make_exception_ptr(std::runtime_error("denied")));

    EXPECT_FALSE(destination->ensureDestinationAvailable());
    EXPECT_TRUE(logger.contains(InternalLogLevel::ERROR, "unable to configure log group/stream"));
    LastError last = stats.lastError();
    ASSERT_GE(last.stacktrace.size(), 2u);
    EXPECT_NE(last.stacktrace.back().find("denied"), std::string::npos);
}

TEST_F(CloudWatchDestinationTest, Limits) {
    create();
    EXPECT_EQ(destination->effectiveSize(TestUtils::makeMessage("hello")), 5u + 26u);
    EXPECT_EQ(destination->maxMessageSize(), 262144u - 26u);
    EXPECT_TRUE(destination->withinServiceLimits(1048576, 10000));
    EXPECT_FALSE(destination->withinServiceLimits(1048577, 1));
    EXPECT_FALSE(destination->withinServiceLimits(100, 10001));
}

TEST_F(CloudWatchDestinationTest, SharedWriterFetchesTokenEverySend) {
    create();
    ASSERT_TRUE(destination->ensureDestinationAvailable());
    const size_t afterInit = mock->retrieveSequenceTokenCount;

    EXPECT_TRUE(destination->send(TestUtils::makeMessages(2)).empty());
    mock->advanceTokenExternally();
    EXPECT_TRUE(destination->send(TestUtils::makeMessages(2)).empty());

    EXPECT_EQ(mock->retrieveSequenceTokenCount, afterInit + 2);
    EXPECT_EQ(mock->allMessagesSent().size(), 4u);
}

TEST_F(CloudWatchDestinationTest, DedicatedWriterCachesToken) {
    config.setDedicatedWriter(true);
    create();
    ASSERT_TRUE(destination->ensureDestinationAvailable());
    const size_t afterInit = mock->retrieveSequenceTokenCount;

    destination->send(TestUtils::makeMessages(1));
    destination->send(TestUtils::makeMessages(1));
    destination->send(TestUtils::makeMessages(1));

    EXPECT_EQ(mock->retrieveSequenceTokenCount, afterInit);
    EXPECT_EQ(mock->putLogEventsCount, 3u);
    EXPECT_EQ(destination->sequenceToken(), "token-4");
}

TEST_F(CloudWatchDestinationTest, DedicatedWriterRaceAndRefresh) {
    config.setDedicatedWriter(true);
    create();
    ASSERT_TRUE(destination->ensureDestinationAvailable());

    mock->advanceTokenExternally();
    try {
        destination->send(TestUtils::makeMessages(1));
        FAIL() << "expected token conflict";
    } catch (const FacadeException& ex) {
        EXPECT_EQ(ex.reason(), ReasonCode::INVALID_SEQUENCE_TOKEN);
    }

    destination->refreshOrderingToken();
    EXPECT_TRUE(destination->send(TestUtils::makeMessages(1)).empty());
    EXPECT_EQ(mock->allMessagesSent().size(), 1u);
}

TEST_F(CloudWatchDestinationTest, MissingStreamOnSend) {
    create();
    ASSERT_TRUE(destination->ensureDestinationAvailable());
    mock->deleteStream();

    try {
        destination->send(TestUtils::makeMessages(1));
        FAIL() << "expected missing stream";
    } catch (const FacadeException& ex) {
        EXPECT_EQ(ex.reason(), ReasonCode::MISSING_DESTINATION);
    }

    // re-provisioning recreates it
    EXPECT_TRUE(destination->ensureDestinationAvailable());
    EXPECT_TRUE(mock->streamExists());
    EXPECT_TRUE(destination->send(TestUtils::makeMessages(1)).empty());
}

TEST_F(CloudWatchDestinationTest, ForeignExceptionsAreTranslated) {
    create();
    ASSERT_TRUE(destination->ensureDestinationAvailable());
    mock->putFailures.add(std::make_exception_ptr(std::logic_error("sdk bug")));

    try {
        destination->send(TestUtils::makeMessages(1));
        FAIL() << "expected FacadeException";
    } catch (const FacadeException& ex) {
        EXPECT_EQ(ex.reason(), ReasonCode::UNEXPECTED_EXCEPTION);
        EXPECT_EQ(ex.operation(), "putLogEvents");
    }
}

TEST_F(CloudWatchDestinationTest, ShutdownIsIdempotent) {
    create();
    destination->shutdown();
    destination->shutdown();
    EXPECT_EQ(mock->shutdownCount, 1u);
}

TEST_F(CloudWatchDestinationTest, UnboundDestinationIsMisuse) {
    std::unique_ptr<CloudWatchClient> client(new MockCloudWatchClient());
    CloudWatchDestination unbound(config, std::move(client));
    EXPECT_FALSE(unbound.isBound());
    EXPECT_THROW(unbound.ensureDestinationAvailable(), std::logic_error);
    EXPECT_THROW({ CloudWatchDestination noClient(config, std::unique_ptr<CloudWatchClient>()); },
                 std::invalid_argument);
}
