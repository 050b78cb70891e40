#ifndef LOGBEAM_HPP
#define LOGBEAM_HPP

#include "logbeam/core/log_common.hpp"
#include "logbeam/core/log_message.hpp"
#include "logbeam/core/discard_action.hpp"
#include "logbeam/core/exception_info.hpp"
#include "logbeam/core/internal_logger.hpp"
#include "logbeam/queue/message_queue.hpp"
#include "logbeam/retry/retry_manager.hpp"
#include "logbeam/destination/facade_exception.hpp"
#include "logbeam/destination/destination_facade.hpp"
#include "logbeam/destination/cloudwatch/cloudwatch_destination.hpp"
#include "logbeam/destination/kinesis/kinesis_destination.hpp"
#include "logbeam/destination/sns/sns_destination.hpp"
#include "logbeam/writer/writer_config.hpp"
#include "logbeam/writer/writer_statistics.hpp"
#include "logbeam/writer/shutdown_hooks.hpp"
#include "logbeam/writer/log_writer.hpp"
#include "logbeam/writer/writer_factory.hpp"

#endif // LOGBEAM_HPP
