#include <uplimit/uplimit.hpp>

#include <cstddef>
#include <cstdlib>
#include <exception>
#include <ios>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

using namespace uplimit;

namespace {

// Streams standard input as a request body, as a connection transport would.
class StdinBodySource final : public BodySource {
 public:
  std::string_view readChunk(std::size_t maxBytes) override {
    _buf.resize(maxBytes);
    std::cin.read(_buf.data(), static_cast<std::streamsize>(maxBytes));
    const auto nbRead = static_cast<std::size_t>(std::cin.gcount());
    if (nbRead == 0 && std::cin.bad()) {
      throw std::ios_base::failure("error while reading standard input");
    }
    return {_buf.data(), nbRead};
  }

 private:
  std::string _buf;
};

}  // namespace

// Usage: upload [max-body-size] [declared-content-length] < payload
//   max-body-size accepts human readable sizes such as 512k or 4MiB (default 1KiB).
int main(int argc, char **argv) {
  std::string_view maxBodySize = argc > 1 ? argv[1] : "1KiB";
  std::string_view contentLength = argc > 2 ? argv[2] : "";

  try {
    UploadLimit limit(UploadLimitConfig{}.withMaxBodyBytes(maxBodySize));
    limit.onBodyCompletion([](const BodyOutcome &outcome) {
      std::cerr << "body " << (outcome.state == BodyReadState::Exhausted ? "complete" : "rejected") << ": "
                << outcome.consumed << " bytes delivered, limit " << outcome.limit << '\n';
    });

    RequestPipeline pipeline;
    limit.installInto(pipeline)
        .setHandler([](HttpRequest &req) {
          std::size_t nbBytes = 0;
          for (std::string_view chunk = req.readBody(); !chunk.empty(); chunk = req.readBody()) {
            nbBytes += chunk.size();
          }
          HttpResponse resp(http::StatusCodeOK);
          resp.body("received " + std::to_string(nbBytes) + " bytes\n");
          return resp;
        });

    HttpRequest request(http::Method::POST, "/upload");
    if (!contentLength.empty()) {
      request.addHeader(http::ContentLength, contentLength);
    }
    request.setBody(std::make_unique<StdinBodySource>());

    HttpResponse resp = pipeline.handle(request);
    std::cout << resp.status() << ' ' << resp.reason() << '\n';
    for (const auto &[name, value] : resp.headers()) {
      std::cout << name << ": " << value << '\n';
    }
    std::cout << '\n' << resp.body() << '\n';
    return resp.status() == http::StatusCodeOK ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }
}
