// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "acme/FilePersist.hxx"
#include "acme/MemoryPersist.hxx"
#include "acmecore/Error.hxx"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static const AcmePersistKey foo_key{
	"acme_account", "foo@example.com",
	AcmePersistKind::ACCOUNT_PRIVATE_KEY,
};

static const AcmePersistKey bar_key{
	"acme_account", "bar@example.com",
	AcmePersistKind::ACCOUNT_PRIVATE_KEY,
};

static void
TestPersist(AcmePersist &persist)
{
	EXPECT_FALSE(persist.Get(foo_key));

	persist.Put(foo_key, "foo"sv);
	EXPECT_EQ(persist.Get(foo_key), "foo");
	EXPECT_FALSE(persist.Get(bar_key));

	persist.Put(bar_key, "bar"sv);
	persist.Put(foo_key, "foo2"sv);
	EXPECT_EQ(persist.Get(foo_key), "foo2");
	EXPECT_EQ(persist.Get(bar_key), "bar");

	/* same key, different kind */
	const AcmePersistKey foo_cert{
		foo_key.realm, foo_key.key,
		AcmePersistKind::CERTIFICATE,
	};
	EXPECT_FALSE(persist.Get(foo_cert));
}

TEST(Persist, Key)
{
	EXPECT_EQ(foo_key.ToString(), "acme_account_acct_key_foo@example.com");
}

TEST(Persist, Memory)
{
	MemoryPersist persist;
	TestPersist(persist);
	EXPECT_EQ(persist.size(), 2u);
}

namespace {

/**
 * A temporary directory which is deleted with all its files.
 */
class TempDirectory {
	std::string path;

public:
	TempDirectory() {
		char buffer[] = "/tmp/acmecore-test-XXXXXX";
		if (mkdtemp(buffer) == nullptr)
			throw std::runtime_error("mkdtemp() failed");
		path = buffer;
	}

	~TempDirectory() noexcept {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::string &GetPath() const noexcept {
		return path;
	}
};

}

TEST(Persist, File)
{
	TempDirectory tmp;
	FilePersist persist(tmp.GetPath());
	TestPersist(persist);

	const auto path = persist.GetPath(foo_key);
	EXPECT_EQ(path, tmp.GetPath() + "/acme_account_acct_key_foo@example.com.key");

	struct stat st;
	ASSERT_EQ(stat(path.c_str(), &st), 0);
	EXPECT_EQ(st.st_mode & 0777, 0600u);

	/* no temporary file left behind */
	EXPECT_NE(access((path + ".tmp").c_str(), F_OK), 0);

	/* another instance sees the same values */
	FilePersist persist2(tmp.GetPath());
	EXPECT_EQ(persist2.Get(bar_key), "bar");
}

TEST(Persist, FileEscape)
{
	TempDirectory tmp;
	FilePersist persist(tmp.GetPath());

	const AcmePersistKey key{
		"acme_account", "../evil/name",
		AcmePersistKind::ACCOUNT_PRIVATE_KEY,
	};

	const auto path = persist.GetPath(key);
	EXPECT_EQ(path, tmp.GetPath() + "/acme_account_acct_key_..%2Fevil%2Fname.key");

	persist.Put(key, "x"sv);
	EXPECT_EQ(persist.Get(key), "x");
}

TEST(Persist, FileEscapeDistinct)
{
	TempDirectory tmp;
	FilePersist persist(tmp.GetPath());

	const AcmePersistKey a{
		"acme_account", "foo=bar@example.com",
		AcmePersistKind::ACCOUNT_PRIVATE_KEY,
	};

	const AcmePersistKey b{
		"acme_account", "foo_bar@example.com",
		AcmePersistKind::ACCOUNT_PRIVATE_KEY,
	};

	const AcmePersistKey c{
		"acme_account", "foo%3Dbar@example.com",
		AcmePersistKind::ACCOUNT_PRIVATE_KEY,
	};

	EXPECT_NE(persist.GetPath(a), persist.GetPath(b));
	EXPECT_NE(persist.GetPath(a), persist.GetPath(c));
	EXPECT_EQ(persist.GetPath(c),
		  tmp.GetPath() + "/acme_account_acct_key_foo%253Dbar@example.com.key");

	persist.Put(a, "a"sv);
	EXPECT_FALSE(persist.Get(b));
	EXPECT_FALSE(persist.Get(c));

	persist.Put(b, "b"sv);
	persist.Put(c, "c"sv);
	EXPECT_EQ(persist.Get(a), "a");
	EXPECT_EQ(persist.Get(b), "b");
	EXPECT_EQ(persist.Get(c), "c");
}

TEST(Persist, FileLeadingDot)
{
	TempDirectory tmp;
	FilePersist persist(tmp.GetPath());

	const AcmePersistKey key{
		".hidden", "x",
		AcmePersistKind::ACCOUNT_PRIVATE_KEY,
	};

	EXPECT_EQ(persist.GetPath(key),
		  tmp.GetPath() + "/%2Ehidden_acct_key_x.key");
}

TEST(Persist, FileError)
{
	FilePersist persist("/nonexistent/directory");

	EXPECT_FALSE(persist.Get(foo_key));

	try {
		persist.Put(foo_key, "foo"sv);
		FAIL();
	} catch (const AcmeError &e) {
		EXPECT_EQ(e.GetKind(), AcmeErrorKind::PERSISTENCE);
	}
}
