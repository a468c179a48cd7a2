/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>

class LStringUtil
{
public:
	static std::string_view Trim(std::string_view Text)
	{
		size_t const First = Text.find_first_not_of(" \t\r\n");
		if (First == std::string_view::npos)
		{
			return {};
		}
		size_t const Last = Text.find_last_not_of(" \t\r\n");
		return Text.substr(First, Last - First + 1);
	}

	// Splits on Delimiter and trims every field, empty fields are kept
	static std::vector<std::string> Split(std::string_view Text, char Delimiter)
	{
		std::vector<std::string> Fields{};
		size_t                   Start = 0;
		while (true)
		{
			size_t const End = Text.find(Delimiter, Start);
			if (End == std::string_view::npos)
			{
				Fields.emplace_back(Trim(Text.substr(Start)));
				break;
			}
			Fields.emplace_back(Trim(Text.substr(Start, End - Start)));
			Start = End + 1;
		}
		return Fields;
	}

	static bool IsDigits(std::string_view Text)
	{
		if (Text.empty())
		{
			return false;
		}
		for (char C : Text)
		{
			if (C < '0' || C > '9')
				return false;
		}
		return true;
	}
};
