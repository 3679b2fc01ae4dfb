// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "AcmeClient.hxx"
#include "AcmeConfig.hxx"
#include "AcmeError.hxx"
#include "FilePersist.hxx"
#include "GlueHttpClient.hxx"
#include "acmecore/Error.hxx"
#include "acmecore/Persist.hxx"
#include "io/Logger.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/PrintException.hxx"
#include "util/StringCompare.hxx"

#include <fmt/core.h>

#include <span>
#include <stdexcept>

#include <stdio.h>
#include <stdlib.h>

struct AutoUsage {};

static AcmeConfig config;

static unsigned verbose = 2;

static void
ApplyConfig(GlueHttpClient &http_client) noexcept
{
	if (config.debug)
		http_client.EnableVerbose();
}

static void
PrintAccount(const AcmeAccount &account) noexcept
{
	fmt::print("status: {}\n", AcmeAccount::FormatStatus(account.status));

	for (const auto &i : account.contact)
		fmt::print("contact: {}\n", i);

	fmt::print("location: {}\n", account.location);

	if (!account.orders.empty())
		fmt::print("orders: {}\n", account.orders);
}

static void
HandleDirectory(std::span<const char *const> args)
{
	if (!args.empty())
		throw AutoUsage();

	GlueHttpClient http_client(config.GetTlsCa());
	ApplyConfig(http_client);
	FilePersist persist(config.store_path);
	const AcmeClient client(http_client, persist, config.GetDirectoryURL());

	const auto &directory = client.GetDirectory();
	for (const auto &[name, url] : directory.entries)
		fmt::print("{}: {}\n", name, url);

	if (!directory.terms_of_service.empty())
		fmt::print("termsOfService: {}\n", directory.terms_of_service);

	if (!directory.website.empty())
		fmt::print("website: {}\n", directory.website);

	for (const auto &i : directory.caa_identities)
		fmt::print("caaIdentity: {}\n", i);

	if (directory.external_account_required)
		fmt::print("externalAccountRequired: true\n");
}

static void
HandleNonce(std::span<const char *const> args)
{
	if (!args.empty())
		throw AutoUsage();

	GlueHttpClient http_client(config.GetTlsCa());
	ApplyConfig(http_client);
	FilePersist persist(config.store_path);
	AcmeClient client(http_client, persist, config.GetDirectoryURL());

	fmt::print("{}\n", client.NewNonce());
}

static void
HandleAccount(std::span<const char *const> args)
{
	if (args.size() != 1)
		throw AutoUsage();

	const char *email = args.front();

	GlueHttpClient http_client(config.GetTlsCa());
	ApplyConfig(http_client);
	FilePersist persist(config.store_path);
	AcmeClient client(http_client, persist, config.GetDirectoryURL());

	const auto identity = client.GetAccount(email);
	PrintAccount(identity.GetAccount());
}

static void
HandleExportKey(std::span<const char *const> args)
{
	if (args.size() != 1)
		throw AutoUsage();

	const char *email = args.front();

	FilePersist persist(config.store_path);
	const auto pem = persist.Get({
			"acme_account", email,
			AcmePersistKind::ACCOUNT_PRIVATE_KEY,
		});
	if (!pem)
		throw AcmeError(AcmeErrorKind::PERSISTENCE,
				fmt::format("No account key for '{}'", email));

	fmt::print("{}", *pem);
}

static constexpr struct Command {
	const char *name, *usage;
	void (*function)(std::span<const char *const> args);
} commands[] = {
	{ "directory", nullptr, HandleDirectory },
	{ "nonce", nullptr, HandleNonce },
	{ "account", "EMAIL", HandleAccount },
	{ "export-key", "EMAIL", HandleExportKey },
};

static const Command *
FindCommand(const char *name) noexcept
{
	for (const auto &i : commands)
		if (StringIsEqual(i.name, name))
			return &i;

	return nullptr;
}

static void
PrintUsage(const char *program) noexcept
{
	fmt::print(stderr, "Usage: {} [OPTIONS] COMMAND ...\n"
		   "\n"
		   "Commands:\n", program);

	for (const auto &i : commands)
		fmt::print(stderr, "  {} {}\n", i.name,
			   i.usage != nullptr ? i.usage : "");

	fmt::print(stderr, "\n"
		   "Options:\n"
		   "  --verbose, -v  increase the log level\n"
		   "  --staging      use the Let's Encrypt staging server\n"
		   "  --directory-url URL\n"
		   "                 use this ACME server\n"
		   "  --tls-ca FILE  accept this CA certificate for TLS\n"
		   "  --debug        let libcurl print protocol details\n"
		   "  --store DIR    store account keys in this directory\n");
}

/**
 * Consume the value of an option which takes one.
 */
static const char *
ShiftValue(std::span<const char *const> &args, const char *option)
{
	if (args.empty())
		throw FmtRuntimeError("Option {} requires a value", option);

	const char *value = args.front();
	args = args.subspan(1);
	return value;
}

/**
 * Parse the options preceding the command and remove them from the
 * list.
 *
 * @return false if an unknown option was found
 */
static bool
ParseOptions(std::span<const char *const> &args)
{
	while (!args.empty() && *args.front() == '-') {
		const char *arg = args.front();
		args = args.subspan(1);

		if (StringIsEqual(arg, "--verbose") || StringIsEqual(arg, "-v"))
			++verbose;
		else if (StringIsEqual(arg, "--staging"))
			config.staging = true;
		else if (StringIsEqual(arg, "--directory-url"))
			config.directory_url = ShiftValue(args, arg);
		else if (const char *url = StringAfterPrefix(arg, "--directory-url="))
			config.directory_url = url;
		else if (StringIsEqual(arg, "--tls-ca"))
			config.tls_ca = ShiftValue(args, arg);
		else if (StringIsEqual(arg, "--debug"))
			config.debug = true;
		else if (StringIsEqual(arg, "--store"))
			config.store_path = ShiftValue(args, arg);
		else {
			fmt::print(stderr, "Unknown option: {}\n\n", arg);
			return false;
		}
	}

	return true;
}

int
main(int argc, char **argv)
try {
	std::span<const char *const> args{argv + 1, static_cast<std::size_t>(argc - 1)};

	if (!ParseOptions(args) || args.empty()) {
		PrintUsage(argv[0]);
		return EXIT_FAILURE;
	}

	SetLogLevel(verbose);

	const char *const name = args.front();
	const auto *command = FindCommand(name);
	if (command == nullptr) {
		fmt::print(stderr, "Unknown command: {}\n", name);
		return EXIT_FAILURE;
	}

	try {
		command->function(args.subspan(1));
	} catch (AutoUsage) {
		fmt::print(stderr, "Usage: {} {} {}\n", argv[0],
			   command->name,
			   command->usage != nullptr ? command->usage : "");
		return EXIT_FAILURE;
	}

	return EXIT_SUCCESS;
} catch (const AcmeError &e) {
	fmt::print(stderr, "[{}] ", AcmeErrorKindToString(e.GetKind()));
	PrintException(e);
	if (IsAcmeBadNonceError(std::current_exception()))
		fmt::print(stderr, "The server rejected the replay nonce; a proxy may be replaying requests\n");
	return EXIT_FAILURE;
} catch (const std::exception &e) {
	PrintException(e);
	return EXIT_FAILURE;
}
