#include "physio/mp_connector.hpp"

using namespace Physio;

int main (int argc, char** argv) {
    Connector* connector = new MpConnector();
    return connector->main(argc, argv);
}
