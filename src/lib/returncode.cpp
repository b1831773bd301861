#include "physio/returncode.hpp"

using namespace Physio;

static const char* const names[] = {
    "MPSUCCESS",
    "MPDRVERR",
    "MPDLLBUSY",
    "MPINVPARA",
    "MPNOTCON",
    "MPREADY",
    "MPWPRETRIG",
    "MPWTRIG",
    "MPBUSY",
    "MPNOACTCH",
    "MPCOMERR",
    "MPINVTYPE",
    "MPNOTINNET",
    "MPSMPLDLERR",
    "MPMEMALLOCERR",
    "MPSOCKERR",
    "MPUNDRFLOW",
    "MPPRESETERR",
    "MPPARSERERR",
};

std::string Physio::describe(int code) {
    if (code < MPSUCCESS || code > MPPARSERERR) {
        return "UNKNOWN";
    }
    return names[code - MPSUCCESS];
}
