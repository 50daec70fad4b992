/**
 * @file packager.cpp
 * @brief pack()/unpack() on top of the generated prometheus protobuf types.
 * @author Dimitris Kafetzis
 */

#include "wire/packager.hpp"

#include "remote.pb.h"

#include <snappy.h>

namespace remote_shipper {

namespace {

prometheus::WriteRequest to_proto(const WriteRequest& request) {
    prometheus::WriteRequest proto;
    proto.mutable_timeseries()->Reserve(static_cast<int>(request.timeseries.size()));
    for (const auto& series : request.timeseries) {
        auto* ts = proto.add_timeseries();
        for (const auto& label : series.labels) {
            auto* l = ts->add_labels();
            l->set_name(label.name);
            l->set_value(label.value);
        }
        for (const auto& sample : series.samples) {
            auto* s = ts->add_samples();
            s->set_timestamp(sample.timestamp_ms);
            s->set_value(sample.value);
        }
    }
    return proto;
}

WriteRequest from_proto(const prometheus::WriteRequest& proto) {
    WriteRequest request;
    request.timeseries.reserve(static_cast<size_t>(proto.timeseries_size()));
    for (const auto& ts : proto.timeseries()) {
        TimeSeries series;
        series.labels.reserve(static_cast<size_t>(ts.labels_size()));
        for (const auto& l : ts.labels()) {
            series.labels.push_back(Label{l.name(), l.value()});
        }
        series.samples.reserve(static_cast<size_t>(ts.samples_size()));
        for (const auto& s : ts.samples()) {
            series.samples.push_back(Sample{s.timestamp(), s.value()});
        }
        request.timeseries.push_back(std::move(series));
    }
    return request;
}

}  // anonymous namespace

Result<std::string> pack(const WriteRequest& request) {
    std::string serialized;
    if (!to_proto(request).SerializeToString(&serialized)) {
        return Error{ErrorKind::Encoding,
                     "Failed to serialize WriteRequest with "
                     + std::to_string(request.size()) + " series"};
    }

    std::string compressed;
    snappy::Compress(serialized.data(), serialized.size(), &compressed);
    return compressed;
}

Result<WriteRequest> unpack(std::string_view body) {
    std::string serialized;
    if (!snappy::Uncompress(body.data(), body.size(), &serialized)) {
        return Error{ErrorKind::Encoding, "Corrupt snappy block"};
    }

    prometheus::WriteRequest proto;
    if (!proto.ParseFromString(serialized)) {
        return Error{ErrorKind::Encoding, "Failed to parse WriteRequest"};
    }
    return from_proto(proto);
}

}  // namespace remote_shipper
