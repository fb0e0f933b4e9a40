#include "prwingest/sink/json_encoder.h"
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <cmath>

namespace prwingest {
namespace sink {

namespace {

rapidjson::Value EncodeValue(const core::Value& value, rapidjson::Document::AllocatorType& allocator) {
    if (value.is_integer()) {
        return rapidjson::Value(static_cast<int64_t>(value.as_integer()));
    }
    double d = value.as_double();
    if (std::isinf(d)) {
        return rapidjson::Value(d > 0 ? "+Inf" : "-Inf", allocator);
    }
    return rapidjson::Value(d);
}

std::string Serialize(const rapidjson::Document& doc) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    doc.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace

std::string JsonEncoder::EncodeDatapoints(const std::vector<core::Datapoint>& datapoints) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    rapidjson::Value array(rapidjson::kArrayType);
    array.Reserve(static_cast<rapidjson::SizeType>(datapoints.size()), allocator);
    for (const auto& dp : datapoints) {
        rapidjson::Value dims(rapidjson::kObjectType);
        for (const auto& [name, value] : dp.dimensions()) {
            dims.AddMember(rapidjson::Value(name.c_str(), static_cast<rapidjson::SizeType>(name.size()), allocator),
                           rapidjson::Value(value.c_str(), static_cast<rapidjson::SizeType>(value.size()), allocator),
                           allocator);
        }

        rapidjson::Value obj(rapidjson::kObjectType);
        obj.AddMember("metric",
                      rapidjson::Value(dp.metric().c_str(),
                                       static_cast<rapidjson::SizeType>(dp.metric().size()), allocator),
                      allocator);
        obj.AddMember("dimensions", dims, allocator);
        obj.AddMember("value", EncodeValue(dp.value(), allocator), allocator);
        obj.AddMember("kind", rapidjson::StringRef(core::to_string(dp.kind())), allocator);
        obj.AddMember("timestamp_ns", static_cast<int64_t>(dp.timestamp_ns()), allocator);
        array.PushBack(obj, allocator);
    }
    doc.AddMember("datapoints", array, allocator);
    return Serialize(doc);
}

std::string JsonEncoder::EncodeError(const std::string& message) {
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();
    doc.AddMember("error",
                  rapidjson::Value(message.c_str(), static_cast<rapidjson::SizeType>(message.size()), allocator),
                  allocator);
    return Serialize(doc);
}

} // namespace sink
} // namespace prwingest
