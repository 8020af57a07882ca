#include <pdfledger/cli/ingest_cli.h>

int main(int argc, char* argv[]) {
    return pdfledger::cli::runIngestCli(argc, argv);
}
