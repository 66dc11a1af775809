#include "udscore/connection.hpp"
#include "udscore/did_codec.hpp"
#include "udscore/errors.hpp"
#include "udscore/request.hpp"
#include "udscore/response.hpp"
#include "udscore/socketcan_isotp.hpp"
#include <iostream>

// Example: read the VIN (DID 0xF190) over a SocketCAN ISO-TP channel
//
//   sudo modprobe can-isotp
//   ./read_vin_example can0 0x7E0 0x7E8

int main(int argc, char** argv) {
    udscore::ConnectionConfig cfg;
    cfg.interface = argc > 1 ? argv[1] : "can0";
    cfg.txid = argc > 2 ? std::stoul(argv[2], nullptr, 0) : 0x7E0;  // Tester -> ECU
    cfg.rxid = argc > 3 ? std::stoul(argv[3], nullptr, 0) : 0x7E8;  // ECU -> Tester

    const auto registry = udscore::ServiceRegistry::standard();

    std::map<udscore::DID, udscore::DidConfig> did_config;
    did_config[0xF190] = std::string("17s");
    const auto codecs = udscore::resolve_did_config(did_config);
    const auto& vin_codec = codecs.at(0xF190);

    udscore::Connection conn(std::make_unique<udscore::SocketCanIsoTp>(0xCC), cfg);

    try {
        udscore::ConnectionGuard guard(conn);

        udscore::Request request(registry.find(udscore::SID::ReadDataByIdentifier),
                                 std::nullopt, false, {0xF1, 0x90});
        std::cout << "-> " << request.to_string() << std::endl;

        conn.empty_rxqueue();
        conn.send(request);

        // P2 = 50 ms, P2* = 5000 ms once the ECU has answered 0x78
        auto timeout = std::chrono::milliseconds(50);
        for (;;) {
            auto frame = conn.wait_frame(timeout, true);
            auto response = udscore::Response::from_payload(registry, *frame);
            std::cout << "<- " << response.to_string() << std::endl;

            if (!response.valid) {
                std::cerr << "Malformed response: " << response.invalid_reason << std::endl;
                return 1;
            }
            if (response.is_response_pending()) {
                timeout = std::chrono::milliseconds(5000);
                continue;
            }
            if (!response.positive) {
                std::cerr << "ECU refused: " << udscore::nrc::format_for_log(*response.code) << std::endl;
                return 1;
            }

            // Positive response echoes the DID before the record
            if (response.data.size() < 2) {
                std::cerr << "Response lacks the DID echo" << std::endl;
                return 1;
            }
            std::vector<uint8_t> record(response.data.begin() + 2, response.data.end());
            auto values = vin_codec->decode(record);
            std::cout << "VIN: " << std::get<std::string>(values[0]) << std::endl;
            return 0;
        }
    } catch (const udscore::Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
