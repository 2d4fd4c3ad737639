/**
 * @file version.h
 * @brief adldap library version
 */

#pragma once

#define ADLDAP_VERSION_MAJOR 1
#define ADLDAP_VERSION_MINOR 0
#define ADLDAP_VERSION_PATCH 0
#define ADLDAP_VERSION_STRING "1.0.0"
