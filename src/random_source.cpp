//
// Copyright (c) 2024 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <boost/formdata/random_source.hpp>
#include <mutex>
#include <random>

namespace boost {
namespace formdata {

namespace {

class mt_random_source
    : public random_source
{
    std::mutex m_;
    std::mt19937 gen_;

public:
    mt_random_source()
        : gen_(std::random_device{}())
    {
    }

protected:
    result_type
    next() override
    {
        std::lock_guard<std::mutex> lock(m_);
        return static_cast<result_type>(gen_());
    }
};

} // (anon)

random_source&
default_random_source()
{
    static mt_random_source rs;
    return rs;
}

} // formdata
} // boost
