// Copyright Global Phasing Ltd.

#ifndef MOLTYPE_VERSION_HPP_
#define MOLTYPE_VERSION_HPP_
#define MOLTYPE_VERSION "0.3.0"
#endif
