/*
    MFlag - collectible municipal flags on XAYA
    Copyright (C) 2026  Autonomous Worlds Ltd

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.
*/

#include "params.hpp"

#include <glog/logging.h>

namespace mfg
{

mflag::Address
PlayerAddress (const std::string& name)
{
  return "p/" + name;
}

void
Params::InitialBlock (unsigned& height, std::string& hashHex) const
{
  switch (chain)
    {
    case xaya::Chain::MAIN:
      height = 2'350'000;
      hashHex
          = "c66f30db579e0aad429648f4cb7dd67648d007ae4313f265a406b88f043b3d93";
      break;

    case xaya::Chain::TEST:
      height = 109'000;
      hashHex
          = "ebc9c179a6a9700777851d2b5452fa1c4b14aaa194a646e2a37cec8ca410e62a";
      break;

    case xaya::Chain::REGTEST:
      height = 0;
      hashHex
          = "6f750b36d22f1dc3d0a6e483af45301022646dfc3b3ba2187865f5a7d6d83ab1";
      break;

    default:
      LOG (FATAL) << "Invalid chain value: " << static_cast<int> (chain);
    }
}

std::string
Params::AdminName () const
{
  switch (chain)
    {
    case xaya::Chain::MAIN:
    case xaya::Chain::TEST:
      return "mflag";

    case xaya::Chain::REGTEST:
      return "admin";

    default:
      LOG (FATAL) << "Invalid chain value: " << static_cast<int> (chain);
    }
}

std::string
Params::PaymentAddress () const
{
  switch (chain)
    {
    case xaya::Chain::MAIN:
      return "CMFLagsKKJDsgcLQQdXqrV9sE5ux6ZUHXn";

    case xaya::Chain::TEST:
      return "dMFLagsNQo3c8ZAHQmTLBtUzCLdZs7Ks3R";

    case xaya::Chain::REGTEST:
      return "dHNvNaqcD7XPDnoRjAoyfcMpHRi5upJD7p";

    default:
      LOG (FATAL) << "Invalid chain value: " << static_cast<int> (chain);
    }
}

std::string
Params::InitialBaseUri () const
{
  return "ipfs://";
}

} // namespace mfg
