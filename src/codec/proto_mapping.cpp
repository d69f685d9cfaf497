#include "proto_mapping.hpp"

namespace pairlink::codec::detail {

void ToProto(const identity::DeviceDescriptor& descriptor, proto::pairing::DeviceDescriptor* out) {
    out->set_hostname(descriptor.hostname);
    out->set_os(descriptor.os);
    out->set_platform(descriptor.platform);
    out->set_arch(descriptor.arch);
}

identity::DeviceDescriptor FromProto(const proto::pairing::DeviceDescriptor& descriptor) {
    return identity::DeviceDescriptor{
        .hostname = descriptor.hostname(),
        .os = descriptor.os(),
        .platform = descriptor.platform(),
        .arch = descriptor.arch(),
    };
}

}
