// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FilePersist.hxx"
#include "acmecore/Error.hxx"

#include <fmt/core.h>

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

[[noreturn]]
static void
ThrowPersistErrno(const char *msg, const std::string &path, int e)
{
	throw AcmeError(AcmeErrorKind::PERSISTENCE,
			fmt::format("{} '{}': {}", msg, path, strerror(e)));
}

static constexpr bool
IsSafeFilenameChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') ||
		ch == '.' || ch == '-' || ch == '_' || ch == '@' || ch == '+';
}

/**
 * Escape all characters which are not safe in a file name (most
 * importantly the slash, and the percent sign itself) as "%XX", so
 * distinct keys never map to the same file.  A leading dot is
 * escaped, too.
 */
static std::string
EscapeFilename(std::string_view s) noexcept
{
	static constexpr char hex_digits[] = "0123456789ABCDEF";

	std::string result;
	result.reserve(s.size());

	for (char ch : s) {
		if (IsSafeFilenameChar(ch) && !(ch == '.' && result.empty())) {
			result.push_back(ch);
		} else {
			const auto b = static_cast<unsigned char>(ch);
			result.push_back('%');
			result.push_back(hex_digits[b >> 4]);
			result.push_back(hex_digits[b & 0xf]);
		}
	}

	return result;
}

static constexpr const char *
GetFilenameSuffix(AcmePersistKind kind) noexcept
{
	switch (kind) {
	case AcmePersistKind::ACCOUNT_PRIVATE_KEY:
	case AcmePersistKind::PRIVATE_KEY:
		return ".key";

	case AcmePersistKind::CERTIFICATE:
		return ".crt";
	}

	return "";
}

std::string
FilePersist::GetPath(const AcmePersistKey &key) const noexcept
{
	std::string path = directory;
	if (!path.empty() && !path.ends_with('/'))
		path.push_back('/');

	path += EscapeFilename(key.ToString());
	path += GetFilenameSuffix(key.kind);
	return path;
}

std::optional<std::string>
FilePersist::Get(const AcmePersistKey &key)
{
	const auto path = GetPath(key);

	const int fd = open(path.c_str(), O_RDONLY|O_CLOEXEC);
	if (fd < 0) {
		const int e = errno;
		if (e == ENOENT)
			return std::nullopt;

		ThrowPersistErrno("Failed to open", path, e);
	}

	std::string result;
	char buffer[4096];

	while (true) {
		const ssize_t nbytes = read(fd, buffer, sizeof(buffer));
		if (nbytes < 0) {
			const int e = errno;
			close(fd);
			ThrowPersistErrno("Failed to read", path, e);
		}

		if (nbytes == 0)
			break;

		result.append(buffer, std::size_t(nbytes));
	}

	close(fd);
	return result;
}

void
FilePersist::Put(const AcmePersistKey &key, std::string_view value)
{
	const auto path = GetPath(key);
	const auto tmp_path = path + ".tmp";

	const mode_t mode = key.kind == AcmePersistKind::CERTIFICATE
		? 0644
		: 0600;

	const int fd = open(tmp_path.c_str(),
			    O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC, mode);
	if (fd < 0)
		ThrowPersistErrno("Failed to create", tmp_path, errno);

	const char *p = value.data();
	std::size_t remaining = value.size();
	while (remaining > 0) {
		const ssize_t nbytes = write(fd, p, remaining);
		if (nbytes < 0) {
			const int e = errno;
			close(fd);
			unlink(tmp_path.c_str());
			ThrowPersistErrno("Failed to write", tmp_path, e);
		}

		p += nbytes;
		remaining -= std::size_t(nbytes);
	}

	if (fsync(fd) < 0 || close(fd) < 0) {
		const int e = errno;
		unlink(tmp_path.c_str());
		ThrowPersistErrno("Failed to write", tmp_path, e);
	}

	if (rename(tmp_path.c_str(), path.c_str()) < 0) {
		const int e = errno;
		unlink(tmp_path.c_str());
		ThrowPersistErrno("Failed to rename", tmp_path, e);
	}
}
