#include "stackhost/program_api.h"

#include <iostream>
#include <string>

using namespace stackhost;

// network -> subnet -> instance, each registered from the previous one's
// callback. The run only finishes once the last link settles.
extern "C" int stackhost_program_abi_version() { return STACKHOST_PROGRAM_ABI_VERSION; }

extern "C" int stackhost_program_main(IProgramContext* ctx, int, char**) {
    ResourceRequest net;
    net.type = "test:network:Vpc";
    net.name = "core";
    net.inputs_json = "{\"cidr\":\"10.0.0.0/16\"}";

    ctx->apply(ctx->register_resource(net), [ctx](const std::string& vpc) {
        ResourceRequest subnet;
        subnet.type = "test:network:Subnet";
        subnet.name = "core-a";
        subnet.inputs_json = "{\"vpc\":" + vpc + "}";

        ctx->apply(ctx->register_resource(subnet), [ctx](const std::string& sn) {
            ResourceRequest vm;
            vm.type = "test:compute:Instance";
            vm.name = "core-a-1";
            vm.inputs_json = "{\"subnet\":" + sn + "}";
            ctx->apply(ctx->register_resource(vm), [ctx](const std::string& inst) {
                ctx->export_value("instance", inst);
                std::cout << "chain_program: instance ready\n";
                return inst;
            });
            return sn;
        });
        return vpc;
    });
    return 0;
}
