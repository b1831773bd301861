#pragma once
#pragma GCC visibility push(default)

#include <string>

namespace Physio {

    // status codes reported by the vendor's mpdev library
    enum ReturnCode {
        MPSUCCESS = 1,
        MPDRVERR,
        MPDLLBUSY,
        MPINVPARA,
        MPNOTCON,
        MPREADY,
        MPWPRETRIG,
        MPWTRIG,
        MPBUSY,
        MPNOACTCH,
        MPCOMERR,
        MPINVTYPE,
        MPNOTINNET,
        MPSMPLDLERR,
        MPMEMALLOCERR,
        MPSOCKERR,
        MPUNDRFLOW,
        MPPRESETERR,
        MPPARSERERR
    };

    // symbolic name of a vendor return code, "UNKNOWN" for anything outside the table
    std::string describe(int code);

}
