#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <string>

extern std::string keyfile;
extern std::string hostname;
extern std::string bucket_name;

int main(int argc, char* argv[])
{
    Catch::Session session;

    // the S3 options only matter to the hidden [libs3] tests
    using namespace Catch::clara;
    auto cli
        = session.cli()
        | Opt(hostname, "hostname")
            ["--hostname"]
            ("the S3 host (default: s3.amazonaws.com)")
        | Opt(keyfile, "keyfile")
            ["--keyfile"]
            ("the file holding the access key and secret access key")
        | Opt(bucket_name, "bucket")
            ["--bucket"]
            ("an existing bucket the live tests may write to");

    session.cli(cli);

    int return_code = session.applyCommandLine(argc, argv);
    if (return_code != 0) {
        return return_code;
    }

    return session.run();
}
