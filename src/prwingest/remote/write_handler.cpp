#include "prwingest/remote/write_handler.h"
#include "prwingest/remote/label_mapper.h"
#include "prwingest/remote/type_classifier.h"
#include "prwingest/remote/wire_codec.h"
#include "prwingest/sink/json_encoder.h"
#include "prwingest/common/logger.h"
#include "prwingest/core/error.h"
#include "remote.pb.h"

#include <chrono>

namespace prwingest {
namespace remote {

WriteHandler::WriteHandler(std::shared_ptr<sink::DatapointSink> sink,
                           std::shared_ptr<metrics::IngestCounters> counters)
    : sink_(std::move(sink))
    , counters_(counters ? std::move(counters) : std::make_shared<metrics::IngestCounters>())
    , converter_(counters_) {
    if (!sink_) {
        throw core::InvalidArgumentError("WriteHandler requires a sink");
    }
}

server::Response WriteHandler::Handle(const core::Context& ctx, const server::Request& req) {
    auto start_time = std::chrono::steady_clock::now();
    uint64_t request_id = ++request_counter_;

    server::Response res;
    try {
        std::string body = ReadBody(req);
        PRWINGEST_DEBUG("[REQ:{}] Remote write body: {} bytes", request_id, body.size());

        auto write_req = WireCodec::Decode(body);
        PRWINGEST_DEBUG("[REQ:{}] Decoded {} time series", request_id, write_req.timeseries_size());

        auto batch = ConvertWriteRequest(write_req);
        size_t batch_size = batch.size();
        counters_->RecordBatchSize(batch_size);

        if (!batch.empty()) {
            Forward(ctx, std::move(batch));
        }

        res.status = 200;
        res.body = "{}";
        PRWINGEST_INFO("[REQ:{}] Forwarded {} datapoints from {} series",
                       request_id, batch_size, write_req.timeseries_size());
    } catch (const core::Error& e) {
        counters_->RecordError();
        res.status = core::HttpStatusFor(e.code());
        res.body = sink::JsonEncoder::EncodeError(e.what());
        PRWINGEST_ERROR("[REQ:{}] {} ({}): {}", request_id, res.status, core::CodeName(e.code()), e.what());
    } catch (const std::exception& e) {
        counters_->RecordError();
        res.status = 500;
        res.body = sink::JsonEncoder::EncodeError(e.what());
        PRWINGEST_ERROR("[REQ:{}] Unexpected exception: {}", request_id, e.what());
    }

    auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time).count();
    counters_->RecordLatency(static_cast<uint64_t>(duration));
    return res;
}

std::vector<core::Datapoint> WriteHandler::ConvertWriteRequest(
    const ::prometheus::WriteRequest& request) const {
    std::vector<core::Datapoint> batch;
    batch.reserve(request.timeseries_size());
    for (const auto& series : request.timeseries()) {
        ConvertSeries(series, batch);
    }
    return batch;
}

void WriteHandler::ConvertSeries(const ::prometheus::TimeSeries& series,
                                 std::vector<core::Datapoint>& batch) const {
    auto mapped = LabelMapper::Map(series.labels());
    if (!mapped.metric_name || mapped.metric_name->empty()) {
        counters_->RecordBadDatapoints(static_cast<uint64_t>(series.samples_size()));
        PRWINGEST_TRACE("Dropped series without metric name ({} samples)", series.samples_size());
        return;
    }

    SeriesIdentity identity{
        *mapped.metric_name,
        std::make_shared<const core::LabelMap>(std::move(mapped.dimensions)),
        TypeClassifier::Classify(*mapped.metric_name)};

    for (const auto& sample : series.samples()) {
        auto dp = converter_.Convert(sample, identity);
        if (dp) {
            batch.push_back(std::move(*dp));
        }
    }
}

std::string WriteHandler::ReadBody(const server::Request& req) const {
    if (!req.body) {
        throw core::ReadError("request has no body");
    }
    return req.body->ReadAll();
}

void WriteHandler::Forward(const core::Context& ctx, std::vector<core::Datapoint> batch) {
    size_t size = batch.size();
    if (ctx.IsDone()) {
        throw core::CancelledError("request context done, discarded " +
                                   std::to_string(size) + " datapoints");
    }
    auto result = sink_->AddDatapoints(ctx, std::move(batch));
    if (result.ok()) {
        return;
    }
    if (result.code() == core::Error::Code::CANCELLED) {
        throw core::CancelledError("forward of " + std::to_string(size) +
                                   " datapoints abandoned: " + result.error());
    }
    throw core::SinkForwardError("sink rejected " + std::to_string(size) +
                                 " datapoints: " + result.error());
}

std::vector<core::Datapoint> WriteHandler::Datapoints() const {
    return counters_->Datapoints();
}

} // namespace remote
} // namespace prwingest
