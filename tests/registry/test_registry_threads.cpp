#include "test_helpers.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace TestHelpers;
using JsonTree::Context;
using JsonTree::DecodeResult;
using JsonTree::EncodingRegistry;
using JsonTree::Node;
using JsonTree::TypeRegistry;
namespace options = JsonTree::options;

struct Sensor {
    virtual ~Sensor() = default;
    virtual int channel() const = 0;
};

struct Thermometer : Sensor {
    int ch = 0;
    int channel() const override { return ch; }
};

template<>
struct JsonTree::StructMeta<Thermometer> {
    using Fields = StructFields<Field<&Thermometer::ch, "ch">>;
};

DecodeResult makeSensor(const Node & node, const Context & ctx, std::unique_ptr<Sensor> & out) {
    auto t = std::make_unique<Thermometer>();
    if(auto r = node.decode(*t, options::context(ctx)); !r) return r;
    out = std::move(t);
    return {};
}

// Distinct abstract types registered while decoding is under way
template<int N>
struct Slot {
    virtual ~Slot() = default;
    virtual int slot() const = 0;
};

template<int N>
DecodeResult makeNothing(const Node &, const Context &, std::unique_ptr<Slot<N>> &) {
    return DecodeResult::Failure("not built in this test");
}

template<int... N>
void registerSlots(TypeRegistry & registry, std::integer_sequence<int, N...>) {
    (registry.registerType<Slot<N>>(makeNothing<N>), ...);
}

struct Rack {
    std::vector<std::unique_ptr<Sensor>> sensors;
    JsonTree::Annotated<std::vector<std::uint8_t>, options::json<"serial,hex">> serial;
};

constexpr int kReaders = 4;
constexpr int kRounds = 300;
constexpr int kEncodings = 64;

int main() {
    TypeRegistry types;
    EncodingRegistry encodings;
    types.registerType<Sensor>(makeSensor);

    std::atomic<int> failures{0};
    std::atomic<bool> writerDone{false};

    std::thread writer([&] {
        registerSlots(types, std::make_integer_sequence<int, 32>{});
        for(int i = 0; i < kEncodings; i ++) {
            encodings.registerEncoding("hex" + std::to_string(i), JsonTree::encodings::hex());
        }
        writerDone = true;
    });

    std::vector<std::thread> readers;
    for(int t = 0; t < kReaders; t ++) {
        readers.emplace_back([&, t] {
            for(int round = 0; round < kRounds; round ++) {
                Rack rack;
                auto res = JsonTree::Unmarshal(R"({"sensors":[{"ch":1},{"ch":2}],"serial":"0a0b"})", rack,
                                               options::types(types), options::encodings(encodings));
                if(!res || rack.sensors.size() != 2 || rack.sensors[1]->channel() != 2
                   || rack.serial->size() != 2 || rack.serial->at(1) != 0x0b) {
                    failures ++;
                }

                // A name seen registered must decode like the scheme behind it
                auto scheme = encodings.lookup("hex" + std::to_string((round + t) % kEncodings));
                if(scheme) {
                    std::vector<std::uint8_t> bytes;
                    auto r = JsonTree::Unmarshal(R"("616263")", bytes, options::encoding(scheme));
                    if(!r || bytes != std::vector<std::uint8_t>{'a', 'b', 'c'}) {
                        failures ++;
                    }
                }
                if(!types.lookup<Sensor>() || !encodings.lookup("base64")) {
                    failures ++;
                }
            }
        });
    }

    writer.join();
    for(auto & r : readers) {
        r.join();
    }

    Check(writerDone, "Registrations finished");
    Check(failures == 0, "Decoding stays correct while registrations run");
    Check(types.lookup<Slot<0>>() && types.lookup<Slot<31>>(), "Types registered from another thread are visible");
    Check(encodings.lookup("hex0") && encodings.lookup("hex" + std::to_string(kEncodings - 1)),
          "Encodings registered from another thread are visible");

    {
        Rack rack;
        Check(DecodeSucceeds(rack, R"({"sensors":[{"ch":9}],"serial":"ff"})", options::types(types),
                             options::encodings(encodings))
              && rack.sensors[0]->channel() == 9,
              "Registries remain usable after the threads join");
    }

    return Report();
}
