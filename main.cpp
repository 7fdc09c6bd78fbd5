#include <iostream>
#include <string>

#include "src/ghclient/client/client.hpp"
#include "src/ghclient/client/config.hpp"
#include "src/ghclient/client/curl_global.hpp"
#include "src/ghclient/error/errors.hpp"

// Lists every item of a paginated endpoint, e.g.
//   ghclient_demo /repos/rust-lang/rust/releases?per_page=50
int main(int argc, char** argv) {
    try {
        const std::string path = argc > 1 ? argv[1] : "/repositories";
        const std::string field = argc > 2 ? argv[2] : "name";

        ghclient::client::CurlGlobal curl_global;

        const auto config = ghclient::client::ClientConfig::from_env();
        auto client = ghclient::client::ClientBuilder::from_config(config).validate().build();

        // Prints `field` when the item has it, the item's JSON otherwise.
        ghclient::json::ItemDecoder<std::string> decode = [&field](ghclient::json::Element item) {
            ghclient::json::Element value;
            if (item.is_object() && item.get_object().at_key(field).get(value) == simdjson::SUCCESS) {
                return ghclient::json::from_element<std::string>(value);
            }
            return ghclient::json::from_element<std::string>(item);
        };

        auto first = client->get_page<std::string>(path, decode);
        if (auto pages = first.number_of_pages()) {
            std::cout << "pages: " << *pages << "\n";
        }
        if (first.total_count_) {
            std::cout << "total_count: " << *first.total_count_ << "\n";
        }

        size_t count = 0;
        for (const std::string& item : client->stream<std::string>(std::move(first), decode)) {
            std::cout << item << "\n";
            ++count;
        }
        std::cout << count << " items" << std::endl;
    } catch (const ghclient::error::HttpError& e) {
        std::cerr << "HTTP Error: " << e.what() << " (URL: " << e.url_ << ")\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
