/**
 * @file schema.h
 * @brief Active Directory attribute names and object categories
 *
 * Attribute names are lower-case to match the keys of Attributes.
 */

#pragma once

namespace adldap::schema {

// Attributes
constexpr const char* ANR = "anr";
constexpr const char* COMMON_NAME = "cn";
constexpr const char* NAME = "name";
constexpr const char* DESCRIPTION = "description";
constexpr const char* DISTINGUISHED_NAME = "distinguishedname";
constexpr const char* OBJECT_CLASS = "objectclass";
constexpr const char* OBJECT_CATEGORY = "objectcategory";
constexpr const char* OBJECT_SID = "objectsid";
constexpr const char* MEMBER = "member";
constexpr const char* MEMBER_OF = "memberof";
constexpr const char* ACCOUNT_NAME = "samaccountname";
constexpr const char* ACCOUNT_TYPE = "samaccounttype";
constexpr const char* DEFAULT_NAMING_CONTEXT = "defaultnamingcontext";

// User
constexpr const char* USER_PRINCIPAL_NAME = "userprincipalname";
constexpr const char* DISPLAY_NAME = "displayname";
constexpr const char* EMAIL = "mail";
constexpr const char* TITLE = "title";
constexpr const char* DEPARTMENT = "department";

// Computer
constexpr const char* OPERATING_SYSTEM = "operatingsystem";
constexpr const char* OPERATING_SYSTEM_VERSION = "operatingsystemversion";
constexpr const char* DNS_HOST_NAME = "dnshostname";

// Group
constexpr const char* GROUP_TYPE = "grouptype";

// Printer
constexpr const char* PRINTER_NAME = "printername";
constexpr const char* SERVER_NAME = "servername";
constexpr const char* PORT_NAME = "portname";
constexpr const char* DRIVER_NAME = "drivername";
constexpr const char* LOCATION = "location";

// Container
constexpr const char* SYSTEM_FLAGS = "systemflags";

// Exchange server
constexpr const char* SERIAL_NUMBER = "serialnumber";
constexpr const char* VERSION_NUMBER = "versionnumber";
constexpr const char* EXCHANGE_SERVER_ROLES = "msexchcurrentserverroles";

// Object categories (first RDN of objectCategory, lower-case)
constexpr const char* OBJECT_CATEGORY_COMPUTER = "computer";
constexpr const char* OBJECT_CATEGORY_PERSON = "person";
constexpr const char* OBJECT_CATEGORY_GROUP = "group";
constexpr const char* OBJECT_CATEGORY_CONTAINER = "container";
constexpr const char* OBJECT_CATEGORY_PRINTER = "print-queue";
constexpr const char* MS_EXCHANGE_SERVER = "ms-exch-exchange-server";

// Object classes
constexpr const char* OBJECT_CLASS_USER = "user";
constexpr const char* OBJECT_CLASS_PERSON = "person";
constexpr const char* OBJECT_CLASS_GROUP = "group";

// sAMAccountType values
constexpr int SECURITY_GLOBAL_GROUP = 268435456;
constexpr int DISTRIBUTION_GROUP = 268435457;

} // namespace adldap::schema
