#pragma once
#ifndef COSTCONFORM_SERVICE_BINDING_H
#define COSTCONFORM_SERVICE_BINDING_H

#include "contract/codec.h"
#include "contract/cost_source_service.h"
#include "transport/channel.h"

namespace costconform {

// Wraps a typed service method as an encoded-payload handler.
template <typename Request, typename Response>
UnaryHandler make_unary_handler(CostSourceService& service,
                                Status (CostSourceService::*fn)(CallContext&, const Request&,
                                                                Response&)) {
    return [&service, fn](CallContext& ctx, const std::string& in, std::string& out) -> Status {
        auto request = decode<Request>(in);
        if (!request) {
            return Status::transport(StatusCode::InvalidArgument, "malformed request payload");
        }
        Response response;
        Status status = (service.*fn)(ctx, *request, response);
        if (status.is_ok()) {
            out = encode(response);
        }
        return status;
    };
}

// Registers every contract method of the service on the channel.
void bind_service(InProcessChannel& channel, CostSourceService& service);

}  // namespace costconform

#endif  // COSTCONFORM_SERVICE_BINDING_H
